/**
 * @file ArchiveBuilder.cpp
 * @brief Implementation of ArchiveBuilder.
 */
#include "application/ArchiveBuilder.hpp"
#include <iostream>
#include <system_error>

namespace discarchiver::application {

namespace fs = std::filesystem;

std::vector<EncoderTool> ArchiveBuilder::DefaultTools() {
    return {
        {"xorriso", {"-as", "mkisofs", "-o", "{output}", "-J", "-R", "-V", "{label}", "{source}"}},
        {"genisoimage", {"-o", "{output}", "-J", "-R", "-V", "{label}", "{source}"}},
        {"mkisofs", {"-o", "{output}", "-J", "-R", "-V", "{label}", "{source}"}},
    };
}

ArchiveBuilder::ArchiveBuilder(std::shared_ptr<domain::CommandRunner> runner,
                               const std::atomic<bool>& cancelled,
                               std::vector<EncoderTool> tools)
    : m_runner(std::move(runner)), m_tools(std::move(tools)), m_cancelled(cancelled) {}

std::string ArchiveBuilder::VolumeLabel(const fs::path& sourceDir) {
    fs::path p = sourceDir;
    if (!p.has_filename()) {
        p = p.parent_path();
    }
    return p.filename().string();
}

std::vector<std::string> ArchiveBuilder::ExpandArguments(const EncoderTool& tool,
                                                         const std::string& output,
                                                         const std::string& label,
                                                         const std::string& source) {
    std::vector<std::string> argv;
    argv.reserve(tool.argumentTemplate.size() + 1);
    argv.push_back(tool.name);
    for (const auto& arg : tool.argumentTemplate) {
        if (arg == "{output}") argv.push_back(output);
        else if (arg == "{label}") argv.push_back(label);
        else if (arg == "{source}") argv.push_back(source);
        else argv.push_back(arg);
    }
    return argv;
}

bool ArchiveBuilder::build(const fs::path& sourceDir, const fs::path& isoPath) {
    std::cout << "[ArchiveBuilder] Generating ISO image: " << isoPath.string() << "..." << std::endl;

    fs::path partial = isoPath;
    partial += ".partial";
    const std::string label = VolumeLabel(sourceDir);
    bool anyAvailable = false;

    for (const auto& tool : m_tools) {
        if (m_cancelled.load()) {
            std::cout << "[ArchiveBuilder] Cancelled; not starting " << tool.name << "." << std::endl;
            return false;
        }
        if (!m_runner->isAvailable(tool.name)) {
            continue;
        }
        anyAvailable = true;

        std::error_code ec;
        fs::remove(partial, ec);

        auto result = m_runner->run(ExpandArguments(tool, partial.string(), label, sourceDir.string()));
        if (!result.succeeded()) {
            std::cerr << "[ArchiveBuilder] Error creating ISO with " << tool.name
                      << " (exit " << result.exitCode << ")" << std::endl;
            if (!result.output.empty()) {
                std::cerr << "[ArchiveBuilder] Output: " << result.output << std::endl;
            }
            fs::remove(partial, ec);
            if (m_cancelled.load()) {
                std::cout << "[ArchiveBuilder] Cancelled while " << tool.name << " was running." << std::endl;
                return false;
            }
            continue;
        }

        if (!fs::exists(partial, ec)) {
            std::cerr << "[ArchiveBuilder] " << tool.name << " reported success but produced no image" << std::endl;
            continue;
        }

        fs::rename(partial, isoPath, ec);
        if (ec) {
            std::cerr << "[ArchiveBuilder] Could not move image into place: " << ec.message() << std::endl;
            fs::remove(partial, ec);
            return false;
        }

        std::cout << "[ArchiveBuilder] ISO created successfully with " << tool.name << ": " << isoPath.string() << std::endl;
        return true;
    }

    if (!anyAvailable) {
        std::cerr << "[ArchiveBuilder] Error: no ISO creation tool found (";
        for (size_t i = 0; i < m_tools.size(); ++i) {
            std::cerr << (i ? ", " : "") << m_tools[i].name;
        }
        std::cerr << ")." << std::endl;
        std::cerr << "[ArchiveBuilder] Please install one of them (e.g. 'sudo pacman -S libisoburn' for xorriso)." << std::endl;
    } else {
        std::cerr << "[ArchiveBuilder] Error: every available ISO tool failed for " << sourceDir.string() << std::endl;
    }
    return false;
}

} // namespace discarchiver::application
