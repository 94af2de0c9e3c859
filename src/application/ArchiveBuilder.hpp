/**
 * @file ArchiveBuilder.hpp
 * @brief Creates an ISO image from a staging directory using the first working encoder.
 */

#pragma once
#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "domain/CommandRunner.hpp"

namespace discarchiver::application {

/**
 * @struct EncoderTool
 * @brief One candidate ISO encoder.
 *
 * The argument template may contain the placeholders {output}, {label}
 * and {source}, which are substituted per invocation.
 */
struct EncoderTool {
    std::string name;
    std::vector<std::string> argumentTemplate;
};

/**
 * @class ArchiveBuilder
 * @brief Tries each encoder in preference order until one produces the image.
 *
 * The image is written to "<target>.partial" and renamed into place only
 * after the encoder exits successfully. A cancelled run never falls back
 * to the next encoder. The builder never touches the
 * staging directory; on total failure it is left intact for recovery.
 */
class ArchiveBuilder {
public:
    /** @brief xorriso, genisoimage, mkisofs (Joliet + Rock Ridge). */
    static std::vector<EncoderTool> DefaultTools();

    /**
     * @param runner Executes the encoders.
     * @param cancelled Shared cancellation flag; once set, no further encoder is started.
     * @param tools Candidates in preference order.
     */
    ArchiveBuilder(std::shared_ptr<domain::CommandRunner> runner,
                   const std::atomic<bool>& cancelled,
                   std::vector<EncoderTool> tools = DefaultTools());

    /**
     * @brief Builds one image of sourceDir at isoPath.
     * @return True if some encoder succeeded and the image is in place.
     */
    bool build(const std::filesystem::path& sourceDir, const std::filesystem::path& isoPath);

    /** @brief Volume label used for a staging directory (its directory name). */
    static std::string VolumeLabel(const std::filesystem::path& sourceDir);

    /** @brief Expands one tool's argument template into a full argv. */
    static std::vector<std::string> ExpandArguments(const EncoderTool& tool,
                                                    const std::string& output,
                                                    const std::string& label,
                                                    const std::string& source);

    const std::vector<EncoderTool>& tools() const { return m_tools; }

private:
    std::shared_ptr<domain::CommandRunner> m_runner;
    std::vector<EncoderTool> m_tools;
    const std::atomic<bool>& m_cancelled;
};

} // namespace discarchiver::application
