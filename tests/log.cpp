#include <cassert>
#include <cimap/log.hpp>
#include <cimap/registry.hpp>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

struct log_test_store
{
    template <typename K, typename V>
    using type = cimap::ordered_hashmap<K, V>;

    static constexpr const char *name = "log_test_ci_map";
};

static std::string read_file(const std::string &path)
{
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void test_log()
{
    using namespace cimap::log;

    auto *service = cimap::alloc<log_service>();
    assert(log_service::instance == service);
    service->threshold = level::trace;

    auto *console = service->add_logger<console_logger>("console");
    service->default_logger = console;
    console->set_pattern("%(color_auto)[%(level_name)] %(ascii_time) %(thread) %(message)%(color_off)\n");
    assert(console->name() == "console");

    service->log(console, level::debug, "Test debug log: %d", 123);
    service->log(console, level::trace, "Test trace log: %d", 123);
    service->log(console, level::error, "Test error log: %d", 123);
    service->log(console, level::warn, "Test warn log: %d", 123);
    service->log(console, level::info, "Test info log: %d", 123);
    service->log(console, level::fatal, "Test fatal log: %d", 123);

    assert(service->get_logger("console") == console);
    service->await();
    service->remove_logger("console");
    assert(service->get_logger("console") == nullptr);
    assert(service->default_logger == nullptr);

    const char *output_dir = getenv("TEST_OUTPUT_DIR");
    assert(output_dir);

    std::string filepath = std::string(output_dir) + "/test_log.txt";
    auto *filelog = service->add_logger<file_logger>("file", filepath, std::ios::out);
    assert(filelog->stream().good());
    filelog->set_pattern("%(level_name): %(message)\n");
    service->default_logger = filelog;

    service->auto_dispatch = false;
    service->log(filelog, level::info, "File log: %d", 456);
    service->threshold = level::warn;
    service->log(filelog, level::info, "Filtered: %d", 789);
    assert(service->dispatch() == 1);

    service->threshold = level::debug;
    service->auto_dispatch = true;
    (void)cimap::registry::instance().build<log_test_store>();
    bool thrown = false;
    try
    {
        (void)cimap::registry::instance().build<int>();
    }
    catch (const cimap::invalid_backing_store &)
    {
        thrown = true;
    }
    assert(thrown);
    service->remove_logger("file");

    std::string content = read_file(filepath);
    assert(content.find("INFO: File log: 456") != std::string::npos);
    assert(content.find("Filtered") == std::string::npos);
#ifdef CIMAP_LOG_ENABLE
    assert(content.find("DEBUG: Registered case-insensitive variant log_test_ci_map (ordered)") != std::string::npos);
    assert(content.find("ERROR: Cannot build a case-insensitive variant over int") != std::string::npos);
#endif

    cimap::release(service);
    assert(log_service::instance == nullptr);
    std::remove(filepath.c_str());
}
