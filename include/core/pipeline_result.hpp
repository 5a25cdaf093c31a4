#pragma once

#include <string>
#include <vector>
#include "core/pipeline_errors.hpp"
#include "core/result.hpp"

/**
 * @brief State of a pipeline run
 */
enum class PipelineState
{
    IDLE,
    SCRIPT_GENERATING,
    SYNTHESIZING,
    ASSET_RESOLVING,
    COMPOSING,
    DONE,
    FAILED
};

/**
 * @brief Where a run failed. PREFLIGHT is the configuration check that runs
 * before the state machine leaves IDLE.
 */
enum class PipelineStage
{
    PREFLIGHT,
    SCRIPT_GENERATING,
    SYNTHESIZING,
    ASSET_RESOLVING,
    COMPOSING
};

/**
 * @brief Intermediate artifacts produced before a failure, kept for diagnostic replay
 */
struct PartialArtifacts
{
    std::string script;
    std::string audio_location;
    std::vector<std::string> asset_locations;
};

struct PipelineSuccess
{
    std::string video_path;
};

struct PipelineFailure
{
    PipelineStage stage;
    PipelineErrorKind kind;
    std::string message;
    int attempts = 0;
    PartialArtifacts partial;
};

using PipelineResult = Result<PipelineSuccess, PipelineFailure>;

class PipelineStates
{
public:
    static std::string getStateName(PipelineState state)
    {
        switch (state)
        {
        case PipelineState::IDLE:
            return "Idle";
        case PipelineState::SCRIPT_GENERATING:
            return "ScriptGenerating";
        case PipelineState::SYNTHESIZING:
            return "Synthesizing";
        case PipelineState::ASSET_RESOLVING:
            return "AssetResolving";
        case PipelineState::COMPOSING:
            return "Composing";
        case PipelineState::DONE:
            return "Done";
        case PipelineState::FAILED:
            return "Failed";
        default:
            return "Unknown";
        }
    }

    static std::string getStageName(PipelineStage stage)
    {
        switch (stage)
        {
        case PipelineStage::PREFLIGHT:
            return "Preflight";
        case PipelineStage::SCRIPT_GENERATING:
            return "ScriptGenerating";
        case PipelineStage::SYNTHESIZING:
            return "Synthesizing";
        case PipelineStage::ASSET_RESOLVING:
            return "AssetResolving";
        case PipelineStage::COMPOSING:
            return "Composing";
        default:
            return "Unknown";
        }
    }

    /**
     * @brief One-line summary for logs and the command line
     */
    static std::string describe(const PipelineResult &result)
    {
        if (result.ok())
        {
            return "Success(" + result.value().video_path + ")";
        }
        const auto &failure = result.error();
        return "Failure(stage=" + getStageName(failure.stage) +
               ", kind=" + PipelineErrors::getKindName(failure.kind) +
               ", message=" + failure.message + ")";
    }
};
