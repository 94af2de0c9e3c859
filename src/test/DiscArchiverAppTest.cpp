#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>
#include <nlohmann/json.hpp>

#include "app/DiscArchiverApp.hpp"

namespace fs = std::filesystem;
using discarchiver::app::DiscArchiverApp;

namespace {

struct Session {
    fs::path root;
    fs::path library;
    fs::path backups;
    fs::path state;
    fs::path assets;
    fs::path config;
};

Session MakeSession() {
    Session s;
    s.root = fs::temp_directory_path() / ("discarchiver_app_" + std::to_string(::getpid()));
    fs::remove_all(s.root);
    s.library = s.root / "library";
    s.backups = s.root / "backups";
    s.state = s.root / "state.json";
    s.assets = s.root / "assets.json";
    s.config = s.root / "discarchiver.json";
    fs::create_directories(s.library / "u1");

    std::ofstream(s.library / "u1" / "a.jpg") << std::string(600, 'a');
    std::ofstream(s.library / "u1" / "b.jpg") << std::string(600, 'b');
    std::ofstream(s.library / "u1" / "c.mp4") << std::string(300, 'c');

    std::ofstream(s.assets) << R"([
        {"id": "a", "originalPath": "/upload/u1/a.jpg", "originalFileName": "a.jpg",
         "fileCreatedAt": "2018-03-01T08:00:00+00:00", "fileSizeInByte": 600},
        {"id": "b", "originalPath": "/upload/u1/b.jpg", "originalFileName": "b.jpg",
         "fileCreatedAt": "2018-03-02T08:00:00+00:00", "fileSizeInByte": 600},
        {"id": "c", "originalPath": "/upload/u1/c.mp4", "originalFileName": "clip",
         "fileCreatedAt": "2018-03-03T08:00:00+00:00", "fileSizeInByte": 300}
    ])";

    nlohmann::json cfg = {
        {"backup_dir", s.backups.string()},
        {"state_file", s.state.string()},
        {"capacity", 1000},
        {"threads", 2},
        {"container_upload_path", "/upload"},
        {"host_upload_path", s.library.string()},
        {"assets_json", s.assets.string()},
    };
    std::ofstream(s.config) << cfg.dump(2);
    return s;
}

int RunApp(const std::vector<std::string>& args, std::string& output, const std::string& input = "") {
    std::vector<const char*> argv;
    argv.push_back("discarchiver");
    for (const auto& a : args) argv.push_back(a.c_str());

    std::istringstream in(input);
    std::ostringstream out;
    DiscArchiverApp app(in, out);
    int code = app.Run(static_cast<int>(argv.size()), argv.data());
    output = out.str();
    return code;
}

} // namespace

int main() {
    std::cout << "[Test] Starting DiscArchiver App Test..." << std::endl;
    Session s = MakeSession();
    std::string out;

    // 1. Help, version and argument errors
    std::cout << "[Test] Help, version and bad arguments..." << std::endl;
    assert(RunApp({"--help"}, out) == 0);
    assert(out.find("Usage: discarchiver") != std::string::npos);
    assert(RunApp({"--version"}, out) == 0);
    assert(out.find("discarchiver ") == 0);
    assert(RunApp({"--nope"}, out) == 1);
    assert(RunApp({"--capacity", "0"}, out) == 1);

    // 2. Plan mode prints the summary and touches nothing
    std::cout << "[Test] Plan mode..." << std::endl;
    assert(RunApp({"--config", s.config.string(), "--plan"}, out) == 0);
    assert(out.find("Total Assets:      3") != std::string::npos);
    assert(out.find("DVDs needed:       2") != std::string::npos);
    assert(out.find("2018-03-02 to 2018-03-03") != std::string::npos);
    assert(!fs::exists(s.state));

    // 3. Quit from the prompt, and EOF counts as quit
    std::cout << "[Test] Quit..." << std::endl;
    assert(RunApp({"--config", s.config.string()}, out, "q\n") == 0);
    assert(out.find("Select an option:") != std::string::npos);
    assert(RunApp({"--config", s.config.string()}, out, "") == 0);

    // 4. Invalid selections are reported as errors
    std::cout << "[Test] Invalid selection..." << std::endl;
    assert(RunApp({"--config", s.config.string(), "--select", "3"}, out) == 1);
    assert(RunApp({"--config", s.config.string()}, out, "later\n") == 1);

    // 5. Dry run over every chunk writes nothing
    std::cout << "[Test] Dry run..." << std::endl;
    assert(RunApp({"--config", s.config.string(), "--dry-run", "--select", "all"}, out) == 0);
    assert(out.find("3 assets placed, 0 failed") != std::string::npos);
    assert(!fs::exists(s.backups / "DVD_1"));
    assert(!fs::exists(s.state));

    // 6. Resume with every chunk archived has nothing to do
    std::cout << "[Test] Resume past the end..." << std::endl;
    std::ofstream(s.state) << R"({"last_asset_id": "c", "current_dvd": 3, "current_dvd_size": 0})";
    assert(RunApp({"--config", s.config.string(), "--select", "resume"}, out) == 0);
    assert(out.find("Nothing to do") != std::string::npos);

    // Only DVD 2 was archived: resume still covers DVD 1.
    std::ofstream(s.state) << R"({"last_asset_id": "c", "current_dvd": 1, "current_dvd_size": 0, "archived_dvds": [2]})";
    assert(RunApp({"--config", s.config.string(), "--dry-run", "--select", "resume"}, out) == 0);
    assert(out.find("1 assets placed, 0 failed across 1 DVD(s)") != std::string::npos);

    // 7. A failing inventory source is fatal
    std::cout << "[Test] Missing inventory..." << std::endl;
    assert(RunApp({"--config", s.config.string(), "--assets-json", (s.root / "missing.json").string(), "--plan"}, out) == 1);

    fs::remove_all(s.root);
    std::cout << "[PASS] DiscArchiver App Test." << std::endl;
    return 0;
}
