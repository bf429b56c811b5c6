#include "rpc/Serializer.hpp"

#include "engine/TorrentRegistry.hpp"
#include "utils/Json.hpp"

#include <yyjson.h>

namespace tb::rpc
{

namespace
{

yyjson_mut_val *add_arguments(tb::json::MutableDocument &doc)
{
    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    yyjson_mut_obj_add_str(native, root, "result", "success");
    auto *arguments = yyjson_mut_obj(native);
    yyjson_mut_obj_add_val(native, root, "arguments", arguments);
    return arguments;
}

void add_optional_string(yyjson_mut_doc *doc, yyjson_mut_val *obj,
                         char const *key,
                         std::optional<std::string> const &value)
{
    if (value)
    {
        yyjson_mut_obj_add_strcpy(doc, obj, key, value->c_str());
    }
    else
    {
        yyjson_mut_obj_add_null(doc, obj, key);
    }
}

yyjson_mut_val *transfer_to_json(yyjson_mut_doc *doc,
                                 storage::TransferRecord const &record)
{
    auto *obj = yyjson_mut_obj(doc);
    yyjson_mut_obj_add_strcpy(doc, obj, "id", record.id.c_str());
    yyjson_mut_obj_add_strcpy(doc, obj, "torrent_name",
                              record.torrent_name.c_str());
    yyjson_mut_obj_add_strcpy(doc, obj, "torrent_hash",
                              record.torrent_hash.c_str());
    yyjson_mut_obj_add_strcpy(doc, obj, "source_client",
                              record.source_client.c_str());
    yyjson_mut_obj_add_strcpy(doc, obj, "target_client",
                              record.target_client.c_str());
    add_optional_string(doc, obj, "connection_name", record.connection_name);
    yyjson_mut_obj_add_strcpy(doc, obj, "media_type",
                              record.media_type.c_str());
    add_optional_string(doc, obj, "media_manager", record.media_manager);
    if (record.size_bytes)
    {
        yyjson_mut_obj_add_sint(doc, obj, "size_bytes", *record.size_bytes);
    }
    else
    {
        yyjson_mut_obj_add_null(doc, obj, "size_bytes");
    }
    yyjson_mut_obj_add_sint(doc, obj, "bytes_transferred",
                            record.bytes_transferred);
    yyjson_mut_obj_add_strcpy(doc, obj, "status", record.status.c_str());
    add_optional_string(doc, obj, "error_message", record.error_message);
    yyjson_mut_obj_add_strcpy(doc, obj, "created_at",
                              record.created_at.c_str());
    add_optional_string(doc, obj, "started_at", record.started_at);
    add_optional_string(doc, obj, "completed_at", record.completed_at);
    return obj;
}

yyjson_mut_val *
transfers_to_json(yyjson_mut_doc *doc,
                  std::vector<storage::TransferRecord> const &records)
{
    auto *array = yyjson_mut_arr(doc);
    for (auto const &record : records)
    {
        yyjson_mut_arr_append(array, transfer_to_json(doc, record));
    }
    return array;
}

} // namespace

std::string serialize_success()
{
    tb::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }
    add_arguments(doc);
    return doc.write(R"({"result":"error"})");
}

std::string serialize_message(std::string_view message)
{
    tb::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }
    auto *arguments = add_arguments(doc);
    yyjson_mut_obj_add_strn(doc.doc(), arguments, "message", message.data(),
                            message.size());
    return doc.write(R"({"result":"error"})");
}

std::string serialize_transfer(storage::TransferRecord const &record)
{
    tb::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }
    auto *native = doc.doc();
    auto *arguments = add_arguments(doc);
    yyjson_mut_obj_add_val(native, arguments, "transfer",
                           transfer_to_json(native, record));
    return doc.write(R"({"result":"error"})");
}

std::string serialize_transfer_page(storage::TransferPage const &page,
                                    int page_number, int per_page)
{
    tb::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }
    auto *native = doc.doc();
    auto *arguments = add_arguments(doc);
    yyjson_mut_obj_add_val(native, arguments, "transfers",
                           transfers_to_json(native, page.records));
    yyjson_mut_obj_add_sint(native, arguments, "total", page.total);
    yyjson_mut_obj_add_int(native, arguments, "page", page_number);
    yyjson_mut_obj_add_int(native, arguments, "per_page", per_page);
    std::int64_t pages = 0;
    if (per_page > 0)
    {
        pages = (page.total + per_page - 1) / per_page;
    }
    yyjson_mut_obj_add_sint(native, arguments, "pages", pages);
    return doc.write(R"({"result":"error"})");
}

std::string
serialize_transfers(std::vector<storage::TransferRecord> const &records)
{
    tb::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }
    auto *native = doc.doc();
    auto *arguments = add_arguments(doc);
    yyjson_mut_obj_add_val(native, arguments, "transfers",
                           transfers_to_json(native, records));
    return doc.write(R"({"result":"error"})");
}

std::string serialize_transfer_stats(engine::TransferStats const &stats)
{
    tb::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }
    auto *native = doc.doc();
    auto *arguments = add_arguments(doc);
    yyjson_mut_obj_add_sint(native, arguments, "total", stats.total);
    yyjson_mut_obj_add_sint(native, arguments, "completed", stats.completed);
    yyjson_mut_obj_add_sint(native, arguments, "failed", stats.failed);
    yyjson_mut_obj_add_sint(native, arguments, "pending", stats.pending);
    yyjson_mut_obj_add_sint(native, arguments, "transferring",
                            stats.transferring);
    yyjson_mut_obj_add_real(native, arguments, "success_rate",
                            stats.success_rate);
    yyjson_mut_obj_add_sint(native, arguments, "total_bytes_transferred",
                            stats.total_bytes_transferred);
    return doc.write(R"({"result":"error"})");
}

std::string serialize_deleted(std::int64_t deleted)
{
    tb::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }
    auto *arguments = add_arguments(doc);
    yyjson_mut_obj_add_sint(doc.doc(), arguments, "deleted", deleted);
    return doc.write(R"({"result":"error"})");
}

std::string serialize_torrents(std::vector<engine::Torrent> const &torrents)
{
    tb::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }
    auto *native = doc.doc();
    auto *arguments = add_arguments(doc);
    auto *array = yyjson_mut_arr(native);
    for (auto const &torrent : torrents)
    {
        yyjson_mut_arr_append(array, engine::torrent_to_json(native, torrent));
    }
    yyjson_mut_obj_add_val(native, arguments, "torrents", array);
    return doc.write(R"({"result":"error"})");
}

std::string serialize_config(engine::BridgeConfig const &config)
{
    tb::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }
    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    yyjson_mut_obj_add_str(native, root, "result", "success");

    auto public_config =
        tb::json::Document::parse(engine::config_to_json(config, false));
    yyjson_mut_val *arguments = nullptr;
    if (public_config.is_valid() && public_config.root() != nullptr)
    {
        arguments = yyjson_val_mut_copy(native, public_config.root());
    }
    if (arguments == nullptr)
    {
        arguments = yyjson_mut_obj(native);
    }
    yyjson_mut_obj_add_val(native, root, "arguments", arguments);
    return doc.write(R"({"result":"error"})");
}

std::string serialize_history_config(engine::HistorySettings const &history)
{
    tb::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }
    auto *native = doc.doc();
    auto *arguments = add_arguments(doc);
    yyjson_mut_obj_add_bool(native, arguments, "enabled", history.enabled);
    yyjson_mut_obj_add_int(native, arguments, "retention_days",
                           history.retention_days);
    yyjson_mut_obj_add_bool(native, arguments, "track_progress",
                            history.track_progress);
    return doc.write(R"({"result":"error"})");
}

std::string serialize_error(std::string_view message,
                            std::optional<std::string_view> details)
{
    tb::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }

    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    yyjson_mut_obj_add_str(native, root, "result", "error");

    auto *arguments = yyjson_mut_obj(native);
    yyjson_mut_obj_add_val(native, root, "arguments", arguments);
    yyjson_mut_obj_add_strn(native, arguments, "message", message.data(),
                            message.size());
#ifndef NDEBUG
    if (details && !details->empty())
    {
        yyjson_mut_obj_add_strn(native, arguments, "detail", details->data(),
                                details->size());
    }
#endif

    return doc.write(R"({"result":"error"})");
}

} // namespace tb::rpc
