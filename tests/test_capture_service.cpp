#include <gtest/gtest.h>
#include "capture/CaptureService.hpp"
#include "support/FakeCaptureBackend.hpp"
#include "support/LoopHelpers.hpp"

class CaptureServiceTest : public ::testing::Test {
protected:
    EventLoop loop;
    CaptureService service{loop, nullptr};
    std::shared_ptr<FakeCaptureBackend> local  = std::make_shared<FakeCaptureBackend>(loop);
    std::shared_ptr<FakeCaptureBackend> system =
        std::make_shared<FakeCaptureBackend>(loop, BackendKind::System);

    static CaptureOptions quick(double maxSeconds) {
        CaptureOptions o;
        o.maxDurationSeconds = maxSeconds;
        o.tickIntervalMs     = 10;
        o.finalizeTimeoutMs  = 500;
        return o;
    }
};

TEST_F(CaptureServiceTest, OnlySupportedBackendsAreOffered) {
    system->supported = false;
    service.registerBackend(local, quick(29));
    service.registerBackend(system, quick(30));

    auto kinds = service.availableBackends();
    ASSERT_EQ(kinds.size(), 1u);
    EXPECT_EQ(kinds[0], BackendKind::Local);
    EXPECT_TRUE(service.isAvailable(BackendKind::Local));
    EXPECT_FALSE(service.isAvailable(BackendKind::System));
}

TEST_F(CaptureServiceTest, UnregisteredKindHasNoSession) {
    EXPECT_EQ(service.createSession(BackendKind::System), nullptr);
    EXPECT_EQ(service.backend(BackendKind::System), nullptr);
    EXPECT_FALSE(service.isAvailable(BackendKind::System));
}

TEST_F(CaptureServiceTest, SessionsUseBackendDefaults) {
    service.registerBackend(local, quick(29));
    service.registerBackend(system, quick(30));

    auto a = service.createSession(BackendKind::Local);
    auto b = service.createSession(BackendKind::System);
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);
    EXPECT_DOUBLE_EQ(a->maxDurationSeconds(), 29.0);
    EXPECT_DOUBLE_EQ(b->maxDurationSeconds(), 30.0);
    EXPECT_EQ(b->kind(), BackendKind::System);
    EXPECT_NE(a->id(), b->id());

    auto custom = service.createSession(BackendKind::Local, quick(2.5));
    EXPECT_DOUBLE_EQ(custom->maxDurationSeconds(), 2.5);
}

TEST_F(CaptureServiceTest, RegisteringAgainReplacesBackend) {
    service.registerBackend(local, quick(29));
    auto replacement = std::make_shared<FakeCaptureBackend>(loop);
    service.registerBackend(replacement, quick(10));

    EXPECT_EQ(service.backend(BackendKind::Local), replacement);
    EXPECT_DOUBLE_EQ(service.defaultOptions(BackendKind::Local).maxDurationSeconds, 10.0);
}

TEST_F(CaptureServiceTest, ActiveSessionFollowsSlot) {
    service.registerBackend(local, quick(5));
    EXPECT_EQ(service.activeSession(BackendKind::Local), nullptr);

    auto s = service.createSession(BackendKind::Local);
    s->start();
    EXPECT_EQ(service.activeSession(BackendKind::Local), s);
    EXPECT_TRUE(service.slots().busy(BackendKind::Local));

    auto rival = service.createSession(BackendKind::Local);
    EXPECT_FALSE(rival->start());
    EXPECT_EQ(rival->error().kind, ErrorKind::BackendBusy);

    s->cancel();
    EXPECT_EQ(service.activeSession(BackendKind::Local), nullptr);
    EXPECT_TRUE(rival->start());
}

TEST_F(CaptureServiceTest, LocalAndSystemCanRecordTogether) {
    service.registerBackend(local, quick(5));
    service.registerBackend(system, quick(5));

    auto mic = service.createSession(BackendKind::Local);
    auto sys = service.createSession(BackendKind::System);
    EXPECT_TRUE(mic->start());
    EXPECT_TRUE(sys->start());
    drain(loop);

    EXPECT_EQ(mic->state(), CaptureState::Recording);
    EXPECT_EQ(sys->state(), CaptureState::Recording);
}

TEST_F(CaptureServiceTest, DroppedSessionFreesSlot) {
    service.registerBackend(local, quick(5));
    {
        auto s = service.createSession(BackendKind::Local);
        s->start();
        drain(loop);
    }
    EXPECT_FALSE(service.slots().busy(BackendKind::Local));
    EXPECT_TRUE(local->live.empty());
    EXPECT_TRUE(service.createSession(BackendKind::Local)->start());
}
