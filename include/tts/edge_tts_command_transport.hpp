#pragma once

#include <memory>
#include "core/blocking_worker_pool.hpp"
#include "core/process_runner.hpp"
#include "tts/speech_synthesizer.hpp"

/**
 * @brief AsyncSpeechTransport over the edge-tts command line client.
 *
 * The client runs on the blocking worker pool and the response is delivered
 * from that worker. Audio is written next to the requested output, read back
 * and removed; the synthesizer writes the final file.
 *
 * Must be owned by a std::shared_ptr.
 */
class EdgeTtsCommandTransport : public AsyncSpeechTransport,
                                public std::enable_shared_from_this<EdgeTtsCommandTransport>
{
public:
    EdgeTtsCommandTransport(std::shared_ptr<BlockingWorkerPool> pool,
                            std::shared_ptr<CommandRunner> runner = std::make_shared<ProcessRunner>());

    void requestSpeech(const SpeechRequest &request,
                       std::function<void(TransportResponse)> on_response) override;

    static std::vector<std::string> buildArguments(const std::string &executable,
                                                   const SpeechRequest &request,
                                                   const std::string &media_path);

    static constexpr const char *CLIENT_BINARY = "edge-tts";

private:
    TransportResponse requestBlocking(const SpeechRequest &request) const;

    std::shared_ptr<BlockingWorkerPool> pool_;
    std::shared_ptr<CommandRunner> runner_;
};
