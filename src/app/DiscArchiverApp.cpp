/**
 * @file DiscArchiverApp.cpp
 * @brief Implementation of the DiscArchiverApp class.
 */
#include "app/DiscArchiverApp.hpp"
#include "app/CommandLine.hpp"

#include "application/ArchiveBuilder.hpp"
#include "application/BackupOrchestrator.hpp"
#include "application/BinPacker.hpp"
#include "application/ChunkMenu.hpp"
#include "application/Materializer.hpp"
#include "application/WorkerPool.hpp"
#include "infrastructure/PathMapper.hpp"
#include "infrastructure/ProgressTracker.hpp"
#include "infrastructure/PsqlAssetSource.hpp"
#include "infrastructure/ShellCommandRunner.hpp"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>

#ifndef DISCARCHIVER_VERSION
#define DISCARCHIVER_VERSION "dev"
#endif

namespace discarchiver::app {

namespace {

std::atomic<bool> g_cancelRequested{false};

void HandleTerminationSignal(int) {
    g_cancelRequested.store(true);
}

void InstallSignalHandlers() {
    std::signal(SIGINT, HandleTerminationSignal);
    std::signal(SIGTERM, HandleTerminationSignal);
}

} // namespace

DiscArchiverApp::DiscArchiverApp(std::istream& in, std::ostream& out) : m_in(in), m_out(out) {}

bool DiscArchiverApp::ResolveSettings(const CommandLineOptions& options, infrastructure::Settings& settings) {
    using infrastructure::ConfigLoader;

    if (auto configFile = ConfigLoader::FindConfigFile(options.configPath)) {
        ConfigLoader::ApplyFile(*configFile, settings);
    }
    ConfigLoader::ApplyEnvironment(settings);

    try {
        ConfigLoader::ApplyJson(options.overrides, settings);
    } catch (const infrastructure::ConfigError& e) {
        std::cerr << "[DiscArchiverApp] " << e.what() << std::endl;
        return false;
    }

    if (auto error = ConfigLoader::Validate(settings)) {
        std::cerr << "[DiscArchiverApp] Invalid settings: " << *error << std::endl;
        return false;
    }
    return true;
}

std::unique_ptr<domain::AssetSource> DiscArchiverApp::MakeAssetSource(const infrastructure::Settings& settings) const {
    if (!settings.assetsJson.empty()) {
        return std::make_unique<infrastructure::JsonFileAssetSource>(settings.assetsJson);
    }
    return std::make_unique<infrastructure::PsqlAssetSource>(
        std::make_shared<infrastructure::ShellCommandRunner>(),
        settings.postgresContainer,
        settings.postgresUser,
        settings.postgresDatabase);
}

std::string DiscArchiverApp::ReadChoice(const std::string& preset) {
    if (!preset.empty()) {
        m_out << "\nSelect an option: " << preset << std::endl;
        return preset;
    }
    m_out << "\nSelect an option: " << std::flush;
    std::string line;
    if (!std::getline(m_in, line)) {
        return "q";
    }
    return line;
}

int DiscArchiverApp::Run(int argc, const char* const* argv) {
    namespace fs = std::filesystem;

    CommandLineOptions options = CommandLine::Parse(argc, argv);
    if (!options.error.empty()) {
        std::cerr << "[DiscArchiverApp] " << options.error << std::endl;
        CommandLine::PrintUsage(std::cerr);
        return 1;
    }
    if (options.help) {
        CommandLine::PrintUsage(m_out);
        return 0;
    }
    if (options.version) {
        m_out << "discarchiver " << DISCARCHIVER_VERSION << std::endl;
        return 0;
    }

    infrastructure::Settings settings;
    if (!ResolveSettings(options, settings)) {
        return 1;
    }

    std::error_code ec;
    fs::create_directories(settings.backupDir, ec);
    if (ec) {
        std::cerr << "[DiscArchiverApp] Cannot create backup directory " << settings.backupDir
                  << ": " << ec.message() << std::endl;
        return 1;
    }

    infrastructure::ProgressTracker tracker(settings.stateFile);
    tracker.load();

    std::vector<domain::AssetRecord> assets;
    try {
        assets = MakeAssetSource(settings)->fetchAssets();
    } catch (const domain::AssetSourceError& e) {
        std::cerr << "[DiscArchiverApp] Error: " << e.what() << std::endl;
        return 1;
    }
    if (assets.empty()) {
        m_out << "No assets found in database." << std::endl;
        return 0;
    }

    const auto state = tracker.state();
    if (state.lastAssetId) {
        bool known = std::any_of(assets.begin(), assets.end(),
                                 [&](const domain::AssetRecord& a) { return a.id == *state.lastAssetId; });
        if (!known) {
            std::cerr << "[DiscArchiverApp] Warning: last recorded asset " << *state.lastAssetId
                      << " is not in the current inventory; the library may have changed." << std::endl;
        }
    }

    m_out << "Organizing assets into DVD chunks by date..." << std::endl;
    application::BinPacker packer(settings.capacity);
    const auto chunks = packer.pack(assets);

    if (options.plan) {
        application::ChunkMenu::RenderPlanSummary(assets, chunks, settings.capacity, m_out);
        application::ChunkMenu::RenderTable(chunks, m_out);
        return 0;
    }

    application::ChunkMenu::RenderTable(chunks, m_out);
    application::ChunkMenu::RenderOptions(state, m_out);

    auto selection = application::ChunkMenu::ParseSelection(ReadChoice(options.select), chunks.size());
    if (selection.kind == application::Selection::Kind::Quit) {
        return 0;
    }
    if (selection.kind == application::Selection::Kind::Invalid) {
        std::cerr << selection.error << std::endl;
        return 1;
    }

    auto toProcess = application::ChunkMenu::SelectChunks(selection, chunks, state);
    if (toProcess.empty()) {
        m_out << "Nothing to do: every DVD up to " << chunks.size() << " is already archived." << std::endl;
        return 0;
    }

    g_cancelRequested.store(false);
    InstallSignalHandlers();

    auto runner = std::make_shared<infrastructure::ShellCommandRunner>();
    application::WorkerPool pool(static_cast<size_t>(settings.threads));
    application::Materializer materializer(
        infrastructure::PathMapper(settings.containerUploadPath, settings.hostUploadPath),
        pool, &tracker, g_cancelRequested);
    application::ArchiveBuilder archiveBuilder(runner, g_cancelRequested);

    application::OrchestratorOptions orchestratorOptions;
    orchestratorOptions.backupDir = settings.backupDir;
    orchestratorOptions.archivePrefix = settings.archivePrefix;
    orchestratorOptions.materialize.dryRun = settings.dryRun;
    orchestratorOptions.materialize.useLinks = settings.useLinks;
    orchestratorOptions.materialize.progressInterval = settings.progressInterval;

    application::BackupOrchestrator orchestrator(materializer, archiveBuilder, tracker,
                                                 g_cancelRequested, orchestratorOptions);
    auto summary = orchestrator.process(toProcess);

    m_out << "\nSummary: " << summary.totalPlaced() << " assets placed, "
          << summary.totalFailed() << " failed across " << summary.chunks.size() << " DVD(s)." << std::endl;

    if (g_cancelRequested.load()) {
        m_out << "Process cancelled." << std::endl;
        return 130;
    }

    m_out << "\nProcess completed." << std::endl;
    for (const auto& outcome : summary.chunks) {
        if (outcome.stagingFailed || (!outcome.dryRun && !outcome.archived)) {
            return 2;
        }
    }
    return 0;
}

} // namespace discarchiver::app
