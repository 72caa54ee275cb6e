#include "surface_manager.hpp"
#include "gpu_error.hpp"
#include "recording_backend.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>

using namespace snowvk;
using snowvk::recording::Recorder;
using snowvk::recording::RecordingDevice;
using snowvk::recording::RecordingFrame;
using snowvk::recording::RecordingSurface;
using ::testing::_;
using ::testing::Field;
using ::testing::InSequence;
using ::testing::Return;

namespace {

class MockGpuSurface : public IGpuSurface {
public:
    MOCK_METHOD(SurfaceCapabilities, capabilities, (const IGpuDevice&), (const, override));
    MOCK_METHOD(void, configure, (IGpuDevice&, const SurfaceConfiguration&), (override));
    MOCK_METHOD(AcquireResult, acquire_next_frame, (), (override));
};

AcquireResult failed(AcquireStatus status)
{
    AcquireResult r{};
    r.status = status;
    return r;
}

class SurfaceManagerTest : public ::testing::Test {
protected:
    std::shared_ptr<Recorder> rec = std::make_shared<Recorder>();
    RecordingSurface surface{ rec };
    RecordingDevice device{ rec };
};

TEST_F(SurfaceManagerTest, ConfigureTakesFirstReportedCapabilities)
{
    auto mgr = SurfaceManager::configure(surface, device, { 800, 600 });

    const auto& c = mgr.configuration();
    EXPECT_EQ(c.format, vk::Format::eB8G8R8A8Srgb);
    EXPECT_EQ(c.present_mode, vk::PresentModeKHR::eFifo);
    EXPECT_EQ(c.alpha_mode, vk::CompositeAlphaFlagBitsKHR::eOpaque);
    EXPECT_EQ(c.width, 800u);
    EXPECT_EQ(c.height, 600u);
    ASSERT_EQ(rec->configures.size(), 1u);
    EXPECT_EQ(rec->configures[0], c);
}

TEST_F(SurfaceManagerTest, ConfigureRejectsZeroSize)
{
    try
    {
        (void)SurfaceManager::configure(surface, device, { 0, 600 });
        FAIL() << "expected GpuError";
    }
    catch (const GpuError& e)
    {
        EXPECT_EQ(e.code(), GpuErrorCode::ConfigurationRejected);
    }
    EXPECT_TRUE(rec->configures.empty());
}

TEST_F(SurfaceManagerTest, ConfigureRejectsEmptyFormatList)
{
    rec->caps.formats.clear();
    EXPECT_THROW((void)SurfaceManager::configure(surface, device, { 640, 480 }), GpuError);
}

TEST_F(SurfaceManagerTest, ConfigurePropagatesDriverRejection)
{
    rec->reject_configuration = true;
    try
    {
        (void)SurfaceManager::configure(surface, device, { 640, 480 });
        FAIL() << "expected GpuError";
    }
    catch (const GpuError& e)
    {
        EXPECT_EQ(e.code(), GpuErrorCode::ConfigurationRejected);
    }
}

TEST_F(SurfaceManagerTest, ResizeToSameSizeKeepsDimensions)
{
    auto mgr = SurfaceManager::configure(surface, device, { 1024, 768 });
    const SurfaceConfiguration before = mgr.configuration();

    mgr.resize({ 1024, 768 });

    EXPECT_EQ(mgr.configuration(), before);
    ASSERT_EQ(rec->configures.size(), 2u);
    EXPECT_EQ(rec->configures[1], before);
}

TEST_F(SurfaceManagerTest, LastNonZeroResizeWins)
{
    auto mgr = SurfaceManager::configure(surface, device, { 800, 600 });

    mgr.resize({ 1920, 1080 });
    mgr.resize({ 0, 0 });
    mgr.resize({ 300, 200 });
    mgr.resize({ 0, 300 });
    mgr.resize({ 640, 0 });

    EXPECT_EQ(mgr.configuration().width, 300u);
    EXPECT_EQ(mgr.configuration().height, 200u);
    EXPECT_EQ(rec->configures.size(), 3u);
    EXPECT_EQ(rec->configures.back().width, 300u);
    EXPECT_EQ(rec->configures.back().height, 200u);
}

TEST_F(SurfaceManagerTest, ResizeKeepsFormatAndModes)
{
    auto mgr = SurfaceManager::configure(surface, device, { 800, 600 });
    mgr.resize({ 1280, 720 });

    EXPECT_EQ(mgr.configuration().format, vk::Format::eB8G8R8A8Srgb);
    EXPECT_EQ(mgr.configuration().present_mode, vk::PresentModeKHR::eFifo);
}

TEST_F(SurfaceManagerTest, AcquireSucceedsWithoutReconfiguring)
{
    auto mgr = SurfaceManager::configure(surface, device, { 800, 600 });

    auto frame = mgr.acquire_frame();

    EXPECT_NE(frame, nullptr);
    EXPECT_EQ(rec->count("acquire"), 1);
    EXPECT_EQ(rec->configures.size(), 1u);
}

TEST_F(SurfaceManagerTest, SuboptimalAcquireIsAccepted)
{
    auto mgr = SurfaceManager::configure(surface, device, { 800, 600 });
    rec->acquire_script = { AcquireStatus::Suboptimal };

    EXPECT_NE(mgr.acquire_frame(), nullptr);
    EXPECT_EQ(rec->count("acquire"), 1);
}

TEST(SurfaceManagerRetryTest, OneFailureThenSuccessReconfiguresOnce)
{
    auto rec = std::make_shared<Recorder>();
    RecordingDevice device{ rec };
    MockGpuSurface surface;

    EXPECT_CALL(surface, capabilities(_)).WillOnce(Return(rec->caps));
    {
        InSequence seq;
        EXPECT_CALL(surface, configure(_, Field(&SurfaceConfiguration::width, 800u)));
        EXPECT_CALL(surface, acquire_next_frame()).WillOnce([] { return failed(AcquireStatus::Outdated); });
        EXPECT_CALL(surface, configure(_, Field(&SurfaceConfiguration::width, 800u)));
        EXPECT_CALL(surface, acquire_next_frame()).WillOnce([rec] {
            AcquireResult r{};
            r.status = AcquireStatus::Success;
            r.frame = std::make_unique<RecordingFrame>(rec);
            return r;
        });
    }

    auto mgr = SurfaceManager::configure(surface, device, { 800, 600 });
    EXPECT_NE(mgr.acquire_frame(), nullptr);
}

TEST(SurfaceManagerRetryTest, TwoFailuresPropagateAcquireError)
{
    auto rec = std::make_shared<Recorder>();
    RecordingDevice device{ rec };
    MockGpuSurface surface;

    EXPECT_CALL(surface, capabilities(_)).WillOnce(Return(rec->caps));
    EXPECT_CALL(surface, configure(_, _)).Times(2);
    EXPECT_CALL(surface, acquire_next_frame())
        .WillOnce([] { return failed(AcquireStatus::Timeout); })
        .WillOnce([] { return failed(AcquireStatus::Lost); });

    auto mgr = SurfaceManager::configure(surface, device, { 800, 600 });
    try
    {
        (void)mgr.acquire_frame();
        FAIL() << "expected GpuError";
    }
    catch (const GpuError& e)
    {
        EXPECT_EQ(e.code(), GpuErrorCode::SurfaceAcquireFailed);
    }
}

TEST_F(SurfaceManagerTest, RetryUsesLastKnownConfiguration)
{
    auto mgr = SurfaceManager::configure(surface, device, { 800, 600 });
    mgr.resize({ 1280, 720 });
    rec->acquire_script = { AcquireStatus::Outdated };

    EXPECT_NE(mgr.acquire_frame(), nullptr);
    ASSERT_EQ(rec->configures.size(), 3u);
    EXPECT_EQ(rec->configures.back().width, 1280u);
    EXPECT_EQ(rec->configures.back().height, 720u);
}

} // namespace
