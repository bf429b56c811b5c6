#pragma once

namespace tb::runtime
{

void request_shutdown() noexcept;
bool should_shutdown() noexcept;
// Re-arms the flag; used by in-process restarts and tests.
void clear_shutdown_request() noexcept;

} // namespace tb::runtime
