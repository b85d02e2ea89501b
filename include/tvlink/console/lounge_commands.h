#pragma once

#include "tvlink/console/console_commands.h"
#include "tvlink/console/console_engine.h"
#include "tvlink/lounge/lounge_manager.h"

namespace tvlink::console {

// pair / status / add / play / reconnect / disconnect, operating on `lounge`.
// Output goes to `io`; both must outlive the registry.
void register_lounge_commands(ConsoleCommandRegistry& registry,
                              lounge::LoungeManager& lounge,
                              IConsoleTransport& io);

} // namespace tvlink::console
