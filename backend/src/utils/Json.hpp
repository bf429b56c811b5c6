#pragma once

#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

#include <yyjson.h>

namespace tb::json {

class Document {
public:
  Document() = default;
  explicit Document(yyjson_doc *doc) : doc_(doc) {}
  Document(Document &&other) noexcept : doc_(other.doc_) { other.doc_ = nullptr; }
  Document &operator=(Document &&other) noexcept {
    if (this != &other) {
      reset();
      doc_ = other.doc_;
      other.doc_ = nullptr;
    }
    return *this;
  }
  Document(Document const &) = delete;
  Document &operator=(Document const &) = delete;

  ~Document() { reset(); }

  static Document parse(std::string_view payload) {
    return Document(
        yyjson_read(payload.data(), payload.size(), static_cast<yyjson_read_flag>(0)));
  }

  bool is_valid() const noexcept { return doc_ != nullptr; }
  yyjson_val *root() const noexcept {
    return doc_ ? yyjson_doc_get_root(doc_) : nullptr;
  }

private:
  void reset() {
    if (doc_) {
      yyjson_doc_free(doc_);
      doc_ = nullptr;
    }
  }

  yyjson_doc *doc_ = nullptr;
};

class MutableDocument {
public:
  MutableDocument() : doc_(yyjson_mut_doc_new(nullptr)) {}
  MutableDocument(MutableDocument &&other) noexcept : doc_(other.doc_) {
    other.doc_ = nullptr;
  }
  MutableDocument &operator=(MutableDocument &&other) noexcept {
    if (this != &other) {
      reset();
      doc_ = other.doc_;
      other.doc_ = nullptr;
    }
    return *this;
  }
  MutableDocument(MutableDocument const &) = delete;
  MutableDocument &operator=(MutableDocument const &) = delete;

  ~MutableDocument() { reset(); }

  bool is_valid() const noexcept { return doc_ != nullptr; }
  yyjson_mut_doc *doc() const noexcept { return doc_; }
  yyjson_mut_val *root() const noexcept {
    return doc_ ? yyjson_mut_doc_get_root(doc_) : nullptr;
  }

  void set_root(yyjson_mut_val *value) {
    if (doc_) {
      yyjson_mut_doc_set_root(doc_, value);
    }
  }

  std::string write(char const *fallback = "{}", bool pretty = false) const {
    if (!doc_) {
      return fallback ? fallback : "{}";
    }
    auto flags = pretty ? YYJSON_WRITE_PRETTY : YYJSON_WRITE_NOFLAG;
    char *json = yyjson_mut_write(doc_, flags, nullptr);
    std::string result = json ? json : (fallback ? fallback : "{}");
    std::free(json);
    return result;
  }

private:
  void reset() {
    if (doc_) {
      yyjson_mut_doc_free(doc_);
      doc_ = nullptr;
    }
  }

  yyjson_mut_doc *doc_ = nullptr;
};

// Lenient member readers shared by the config loader, the registry snapshot
// and the RPC argument parsing. Numbers encoded as strings are accepted.

inline std::optional<std::string> get_string(yyjson_val *object, char const *key) {
  if (object == nullptr || !yyjson_is_obj(object)) {
    return std::nullopt;
  }
  auto *value = yyjson_obj_get(object, key);
  if (value == nullptr || !yyjson_is_str(value)) {
    return std::nullopt;
  }
  return std::string(yyjson_get_str(value), yyjson_get_len(value));
}

inline std::optional<std::int64_t> to_int(yyjson_val *value) {
  if (value == nullptr) {
    return std::nullopt;
  }
  if (yyjson_is_sint(value)) {
    return yyjson_get_sint(value);
  }
  if (yyjson_is_uint(value)) {
    return static_cast<std::int64_t>(yyjson_get_uint(value));
  }
  if (yyjson_is_real(value)) {
    return static_cast<std::int64_t>(yyjson_get_real(value));
  }
  if (yyjson_is_str(value)) {
    char const *text = yyjson_get_str(value);
    char *end = nullptr;
    auto parsed = std::strtoll(text, &end, 10);
    if (end != text && end != nullptr && *end == '\0') {
      return static_cast<std::int64_t>(parsed);
    }
  }
  return std::nullopt;
}

inline std::optional<std::int64_t> get_int(yyjson_val *object, char const *key) {
  if (object == nullptr || !yyjson_is_obj(object)) {
    return std::nullopt;
  }
  return to_int(yyjson_obj_get(object, key));
}

inline std::optional<double> get_double(yyjson_val *object, char const *key) {
  if (object == nullptr || !yyjson_is_obj(object)) {
    return std::nullopt;
  }
  auto *value = yyjson_obj_get(object, key);
  if (value == nullptr || !yyjson_is_num(value)) {
    return std::nullopt;
  }
  return yyjson_get_num(value);
}

inline std::optional<bool> get_bool(yyjson_val *object, char const *key) {
  if (object == nullptr || !yyjson_is_obj(object)) {
    return std::nullopt;
  }
  auto *value = yyjson_obj_get(object, key);
  if (value == nullptr) {
    return std::nullopt;
  }
  if (yyjson_is_bool(value)) {
    return yyjson_get_bool(value);
  }
  if (auto number = to_int(value)) {
    return *number != 0;
  }
  if (yyjson_is_str(value)) {
    auto content = std::string_view(yyjson_get_str(value));
    if (content == "true") {
      return true;
    }
    if (content == "false") {
      return false;
    }
  }
  return std::nullopt;
}

} // namespace tb::json
