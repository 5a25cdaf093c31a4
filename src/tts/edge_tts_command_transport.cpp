#include "tts/edge_tts_command_transport.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace fs = std::filesystem;

EdgeTtsCommandTransport::EdgeTtsCommandTransport(std::shared_ptr<BlockingWorkerPool> pool,
                                                 std::shared_ptr<CommandRunner> runner)
    : pool_(std::move(pool)), runner_(std::move(runner))
{
    if (!pool_ || !runner_)
    {
        throw std::invalid_argument("EdgeTtsCommandTransport requires a worker pool and a command runner");
    }
}

void EdgeTtsCommandTransport::requestSpeech(const SpeechRequest &request,
                                            std::function<void(TransportResponse)> on_response)
{
    auto self = shared_from_this();
    bool queued = pool_->submit([self, request, on_response]()
                                { on_response(self->requestBlocking(request)); });
    if (!queued)
    {
        TransportResponse response;
        response.error_message = "Blocking worker pool unavailable";
        on_response(response);
    }
}

TransportResponse EdgeTtsCommandTransport::requestBlocking(const SpeechRequest &request) const
{
    TransportResponse response;

    auto executable = runner_->findExecutable(CLIENT_BINARY);
    if (!executable)
    {
        response.error_message = std::string(CLIENT_BINARY) + " not found on PATH";
        return response;
    }

    std::string media_path = request.output_path + ".part";
    std::error_code ec;
    fs::create_directories(fs::path(media_path).parent_path(), ec);

    ProcessOutput output = runner_->run(buildArguments(*executable, request, media_path));
    if (output.exit_code != 0)
    {
        fs::remove(media_path, ec);
        response.error_message = std::string(CLIENT_BINARY) + " exited with code " + std::to_string(output.exit_code) +
                                 ": " + output.output;
        return response;
    }

    std::ifstream media(media_path, std::ios::binary);
    if (!media.is_open())
    {
        response.status = 200;
        return response;
    }
    response.audio.assign(std::istreambuf_iterator<char>(media), std::istreambuf_iterator<char>());
    media.close();
    fs::remove(media_path, ec);

    response.status = 200;
    Logger::debug("[TTS] edge-tts produced " + std::to_string(response.audio.size()) + " bytes");
    return response;
}

std::vector<std::string> EdgeTtsCommandTransport::buildArguments(const std::string &executable,
                                                                 const SpeechRequest &request,
                                                                 const std::string &media_path)
{
    return {executable, "--voice", request.voice_id, "--text", request.text, "--write-media", media_path};
}
