#pragma once

namespace CLI {
class App;
}

namespace streamcache::cli {

// Registers `streamcache fetch`; `exitCode` receives the command's process exit status.
void registerFetchCommand(CLI::App& app, int& exitCode);

} // namespace streamcache::cli
