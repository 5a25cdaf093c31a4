#pragma once

#include <string>
#include <vector>
#include "core/cancellation_token.hpp"
#include "core/pipeline_errors.hpp"
#include "core/result.hpp"
#include "tts/speech_synthesizer.hpp"

using ScriptText = std::string;

/**
 * @brief One segment of a generated script, in script order
 */
struct ScriptSection
{
    size_t index;
    std::string text;
};

enum class AssetKind
{
    IMAGE
};

/**
 * @brief Media resource shown while a script section is narrated.
 * Rendering order is the order of the sequence.
 */
struct AssetItem
{
    std::string location;
    size_t section_index = 0;
    AssetKind kind = AssetKind::IMAGE;
};

using GenerationResult = Result<ScriptText, GenerationError>;
using AssetResult = Result<std::vector<AssetItem>, AssetError>;
using RenderResult = Result<std::string, RenderError>;

/*
 * Stage collaborators. Every call returns immediately and invokes its
 * completion exactly once, from any thread. Implementations should give up
 * early once the token is cancelled.
 */

class ScriptGenerator
{
public:
    virtual ~ScriptGenerator() = default;
    virtual void generate(const std::string &topic,
                          const std::string &language,
                          const CancellationToken &token,
                          Completion<GenerationResult> done) = 0;
};

class AssetResolver
{
public:
    virtual ~AssetResolver() = default;
    virtual void resolve(const std::vector<ScriptSection> &sections,
                         const CancellationToken &token,
                         Completion<AssetResult> done) = 0;
};

class VideoComposer
{
public:
    virtual ~VideoComposer() = default;

    /**
     * @param output_path Where the video is written; the success value is the final path
     */
    virtual void compose(const AudioArtifact &audio,
                         const std::vector<AssetItem> &assets,
                         const std::string &output_path,
                         const CancellationToken &token,
                         Completion<RenderResult> done) = 0;
};
