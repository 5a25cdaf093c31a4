#include <gtest/gtest.h>
#include "core/blocking_worker_pool.hpp"
#include "tts/blocking_synthesizer_adapter.hpp"
#include "tts/edge_synthesizer.hpp"
#include "tts/elevenlabs_synthesizer.hpp"
#include "stubs/pipeline_stubs.hpp"
#include <filesystem>
#include <future>

namespace fs = std::filesystem;

class SpeechSynthesizerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        work_dir_ = fs::temp_directory_path() / "video_factory_tts_test";
        fs::remove_all(work_dir_);
        fs::create_directories(work_dir_);
        pool_ = std::make_shared<BlockingWorkerPool>(2);
    }

    void TearDown() override
    {
        pool_->shutdown();
        fs::remove_all(work_dir_);
    }

    SpeechRequest request(const std::string &file, const std::string &voice = "pt-BR-AntonioNeural")
    {
        return SpeechRequest{"Ola, mundo.", voice, (work_dir_ / file).string()};
    }

    static SynthesisResult synthesizeAndWait(SpeechSynthesizer &synthesizer, const SpeechRequest &req,
                                             const CancellationToken &token = CancellationToken())
    {
        auto promise = std::make_shared<std::promise<SynthesisResult>>();
        auto future = promise->get_future();
        synthesizer.synthesize(req, token, [promise](SynthesisResult result)
                               { promise->set_value(std::move(result)); });
        return future.get();
    }

    std::shared_ptr<SpeechSynthesizer> makeEleven(std::shared_ptr<FakeBlockingTransport> transport,
                                                  const std::string &api_key = "secret")
    {
        return std::make_shared<BlockingSynthesizerAdapter>(
            std::make_shared<ElevenLabsSynthesizer>(transport, api_key), pool_);
    }

    fs::path work_dir_;
    std::shared_ptr<BlockingWorkerPool> pool_;
};

TEST_F(SpeechSynthesizerTest, BothVariantsProduceEquivalentArtifacts)
{
    auto async_transport = std::make_shared<FakeAsyncTransport>(std::vector<TransportResponse>{okResponse(6000)});
    auto blocking_transport = std::make_shared<FakeBlockingTransport>(std::vector<TransportResponse>{okResponse(6000)});
    EdgeSynthesizer edge(async_transport);
    auto eleven = makeEleven(blocking_transport);

    SynthesisResult edge_result = synthesizeAndWait(edge, request("edge.mp3"));
    SynthesisResult eleven_result = synthesizeAndWait(*eleven, request("eleven.mp3"));

    ASSERT_TRUE(edge_result.ok()) << edge_result.error().message;
    ASSERT_TRUE(eleven_result.ok()) << eleven_result.error().message;

    const AudioArtifact &a = edge_result.value();
    const AudioArtifact &b = eleven_result.value();
    EXPECT_EQ(a.duration, b.duration);
    EXPECT_EQ(a.sample_rate_hz, b.sample_rate_hz);
    EXPECT_EQ(a.channels, b.channels);
    EXPECT_EQ(a.format, b.format);
    EXPECT_EQ(a.size_bytes, b.size_bytes);

    // 6000 bytes at 48 kbit/s
    EXPECT_EQ(a.duration, std::chrono::milliseconds(1000));
    EXPECT_EQ(fs::file_size(a.location), 6000u);
    EXPECT_EQ(fs::file_size(b.location), 6000u);
}

TEST_F(SpeechSynthesizerTest, BlockingProviderRunsOnWorkerPool)
{
    auto transport = std::make_shared<FakeBlockingTransport>(std::vector<TransportResponse>{okResponse()});
    auto eleven = makeEleven(transport);

    SynthesisResult result = synthesizeAndWait(*eleven, request("pool.mp3"));

    ASSERT_TRUE(result.ok());
    auto threads = transport->callerThreads();
    ASSERT_EQ(threads.size(), 1u);
    EXPECT_NE(threads[0], std::this_thread::get_id());
}

TEST_F(SpeechSynthesizerTest, EmptyApiKeyIsAuthFailureWithoutVendorCall)
{
    auto transport = std::make_shared<FakeBlockingTransport>(std::vector<TransportResponse>{okResponse()});
    auto eleven = makeEleven(transport, "");

    SynthesisResult result = synthesizeAndWait(*eleven, request("nokey.mp3"));

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, SynthesisErrorKind::AUTH_FAILURE);
    EXPECT_EQ(transport->calls.load(), 0);
}

TEST_F(SpeechSynthesizerTest, SameStatusMapsToSameErrorForBothVariants)
{
    for (int status : {401, 404, 429, 503, 0, 418})
    {
        auto async_transport = std::make_shared<FakeAsyncTransport>(std::vector<TransportResponse>{statusResponse(status)});
        auto blocking_transport = std::make_shared<FakeBlockingTransport>(std::vector<TransportResponse>{statusResponse(status)});
        EdgeSynthesizer edge(async_transport);
        auto eleven = makeEleven(blocking_transport);

        SynthesisResult edge_result = synthesizeAndWait(edge, request("e.mp3"));
        SynthesisResult eleven_result = synthesizeAndWait(*eleven, request("x.mp3"));

        ASSERT_FALSE(edge_result.ok()) << "status " << status;
        ASSERT_FALSE(eleven_result.ok()) << "status " << status;
        EXPECT_EQ(edge_result.error().kind, eleven_result.error().kind) << "status " << status;
    }
}

TEST_F(SpeechSynthesizerTest, ResponseStatusMapping)
{
    struct Case
    {
        int status;
        SynthesisErrorKind kind;
    };
    std::vector<Case> cases{{401, SynthesisErrorKind::AUTH_FAILURE},
                            {403, SynthesisErrorKind::AUTH_FAILURE},
                            {404, SynthesisErrorKind::INVALID_VOICE_ID},
                            {422, SynthesisErrorKind::INVALID_VOICE_ID},
                            {429, SynthesisErrorKind::RATE_LIMITED},
                            {0, SynthesisErrorKind::TRANSIENT_NETWORK_ERROR},
                            {408, SynthesisErrorKind::TRANSIENT_NETWORK_ERROR},
                            {502, SynthesisErrorKind::TRANSIENT_NETWORK_ERROR},
                            {418, SynthesisErrorKind::UNEXPECTED_RESPONSE}};

    for (const auto &c : cases)
    {
        SynthesisResult result = SpeechResponseMapper::toSynthesisResult(request("m.mp3"), statusResponse(c.status));
        ASSERT_FALSE(result.ok());
        EXPECT_EQ(result.error().kind, c.kind) << "status " << c.status;
    }
}

TEST_F(SpeechSynthesizerTest, RateLimitCarriesRetryAfter)
{
    TransportResponse response = statusResponse(429);
    response.retry_after = std::chrono::milliseconds(1500);

    SynthesisResult result = SpeechResponseMapper::toSynthesisResult(request("r.mp3"), response);

    ASSERT_FALSE(result.ok());
    EXPECT_TRUE(result.error().isRetryable());
    ASSERT_TRUE(result.error().retry_after.has_value());
    EXPECT_EQ(*result.error().retry_after, std::chrono::milliseconds(1500));
}

TEST_F(SpeechSynthesizerTest, SuccessWithoutAudioIsUnexpected)
{
    SynthesisResult result = SpeechResponseMapper::toSynthesisResult(request("empty.mp3"), statusResponse(200));

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, SynthesisErrorKind::UNEXPECTED_RESPONSE);
    EXPECT_FALSE(fs::exists(work_dir_ / "empty.mp3"));
}

TEST_F(SpeechSynthesizerTest, VendorDurationIsPreferred)
{
    TransportResponse response = okResponse(6000);
    response.duration = std::chrono::milliseconds(1234);

    SynthesisResult result = SpeechResponseMapper::toSynthesisResult(request("d.mp3"), response);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().duration, std::chrono::milliseconds(1234));
}

TEST_F(SpeechSynthesizerTest, EmptyVoiceIsInvalidVoiceId)
{
    auto async_transport = std::make_shared<FakeAsyncTransport>(std::vector<TransportResponse>{okResponse()});
    EdgeSynthesizer edge(async_transport);

    SynthesisResult result = synthesizeAndWait(edge, request("v.mp3", ""));

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, SynthesisErrorKind::INVALID_VOICE_ID);
    EXPECT_EQ(async_transport->calls.load(), 0);
}

TEST_F(SpeechSynthesizerTest, CancelledTokenSkipsBlockingCall)
{
    auto transport = std::make_shared<FakeBlockingTransport>(std::vector<TransportResponse>{okResponse()});
    auto eleven = makeEleven(transport);
    CancellationToken token;
    token.cancel();

    SynthesisResult result = synthesizeAndWait(*eleven, request("c.mp3"), token);

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(transport->calls.load(), 0);
    EXPECT_EQ(result.error().kind, SynthesisErrorKind::UNEXPECTED_RESPONSE);
    EXPECT_FALSE(result.error().isRetryable());
}

TEST_F(SpeechSynthesizerTest, CancelledTokenSkipsAsyncRequest)
{
    auto transport = std::make_shared<FakeAsyncTransport>(std::vector<TransportResponse>{okResponse()});
    EdgeSynthesizer edge(transport);
    CancellationToken token;
    token.cancel();

    SynthesisResult result = synthesizeAndWait(edge, request("c.mp3"), token);

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(transport->calls.load(), 0);
    EXPECT_EQ(result.error().kind, SynthesisErrorKind::UNEXPECTED_RESPONSE);
    EXPECT_FALSE(result.error().isRetryable());
}

TEST_F(SpeechSynthesizerTest, StoppedPoolReportsFailure)
{
    auto transport = std::make_shared<FakeBlockingTransport>(std::vector<TransportResponse>{okResponse()});
    auto eleven = makeEleven(transport);
    pool_->shutdown();

    SynthesisResult result = synthesizeAndWait(*eleven, request("s.mp3"));

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, SynthesisErrorKind::UNEXPECTED_RESPONSE);
}
