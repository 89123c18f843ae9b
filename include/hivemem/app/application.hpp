/*
 * HiveMem C++ - Application
 *
 * Process lifecycle of the hivemem node: arguments, configuration,
 * logging, libcurl, the engine and the stdin request loop.
 *
 * Requests are newline-delimited JSON objects:
 *   {"id": 1, "action": "memory_store", "params": {"key": "k", "value": 1}}
 * Each one is answered by exactly one JSON line on stdout.
 */
#ifndef hivemem_APP_APPLICATION_HPP
#define hivemem_APP_APPLICATION_HPP

#include <hivemem/core/config.hpp>
#include <hivemem/engine/engine.hpp>
#include <hivemem/tool/memory_tool.hpp>
#include <atomic>
#include <memory>
#include <string>

namespace hivemem {

struct AppInfo {
    static constexpr const char* NAME = "hivemem";
    static constexpr const char* VERSION = "1.0.0";
};

class Application {
public:
    static Application& instance();

    // false for --help/--version or a fatal setup error
    bool init(int argc, char* argv[]);
    int run();
    void shutdown();

    void stop() { running_ = false; }
    bool is_running() const { return running_.load(); }

    // One request line in, one response line out
    std::string handle_line(const std::string& line);

private:
    Application();
    Application(const Application&);
    Application& operator=(const Application&);

    bool parse_args(int argc, char* argv[]);
    bool load_config();
    void setup_logging();

    std::atomic<bool> running_;
    bool curl_ready_;
    bool config_explicit_;
    std::string config_file_;
    Config config_;
    std::unique_ptr<Engine> engine_;
    std::unique_ptr<MemoryTool> tool_;
};

} // namespace hivemem

#endif // hivemem_APP_APPLICATION_HPP
