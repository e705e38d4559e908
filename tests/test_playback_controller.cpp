#include <gtest/gtest.h>
#include "playback/PlaybackController.hpp"
#include "support/FakeWaveformSurface.hpp"
#include "support/LoopHelpers.hpp"

class PlaybackControllerTest : public ::testing::Test {
protected:
    EventLoop loop;
    PlaybackStore store;
    std::shared_ptr<FakeSurfaceFactory> factory = std::make_shared<FakeSurfaceFactory>(loop);
    std::shared_ptr<ObjectUrlRegistry> registry = std::make_shared<ObjectUrlRegistry>();
    PlaybackController controller{store, factory, registry, SurfaceConfig{64, 40, true}};

    PlaybackSession snap() const { return store.snapshot(); }

    // Assigns url, decodes it as `seconds` long and lets autoplay settle
    std::shared_ptr<FakeSurfaceState> loadPlaying(const std::string& url, double seconds) {
        controller.assignSource(url);
        auto surface = factory->last();
        surface->resolveLoad(seconds);
        drain(loop);
        return surface;
    }

    static CapturedClip clip(uint64_t id) {
        CapturedClip c;
        c.bytes     = {1, 2, 3};
        c.mime      = "audio/wav";
        c.sessionId = id;
        return c;
    }
};

TEST_F(PlaybackControllerTest, StartsEmpty) {
    EXPECT_EQ(snap().state, PlaybackState::Empty);
    EXPECT_FALSE(controller.play());
    EXPECT_FALSE(controller.seek(0.5));
    EXPECT_TRUE(controller.peaks().empty());
}

TEST_F(PlaybackControllerTest, LoadAutoplayAndFinish) {
    controller.assignSource(std::string("a.wav"), "a", "Take A");
    EXPECT_EQ(snap().state, PlaybackState::Loading);
    EXPECT_EQ(snap().title, "Take A");
    ASSERT_EQ(factory->surfaces.size(), 1u);
    EXPECT_EQ(factory->configs[0].bars, 64);

    auto surface = factory->last();
    EXPECT_EQ(surface->url, "a.wav");
    surface->reportLoading(40);
    EXPECT_EQ(snap().loadingPercent, 40);

    surface->resolveLoad(3.0);
    EXPECT_EQ(snap().state, PlaybackState::Ready);
    EXPECT_DOUBLE_EQ(snap().totalDuration, 3.0);

    drain(loop);
    EXPECT_EQ(snap().state, PlaybackState::Playing);
    EXPECT_EQ(surface->playCalls, 1);

    surface->finish();
    EXPECT_EQ(snap().state, PlaybackState::Paused);
    EXPECT_DOUBLE_EQ(snap().currentTime, 3.0);
    EXPECT_EQ(controller.peaks().size(), 2u);
}

TEST_F(PlaybackControllerTest, PlayPauseToggle) {
    auto surface = loadPlaying("a.wav", 3.0);

    EXPECT_TRUE(controller.togglePlayPause());
    drain(loop);
    EXPECT_EQ(snap().state, PlaybackState::Paused);

    EXPECT_TRUE(controller.togglePlayPause());
    drain(loop);
    EXPECT_EQ(snap().state, PlaybackState::Playing);
}

TEST_F(PlaybackControllerTest, StaleLoadFromPreviousSourceIsIgnored) {
    controller.assignSource(std::string("a.wav"));
    auto a = factory->last();
    uint64_t genA = controller.loadGeneration();

    controller.assignSource(std::string("b.wav"));
    auto b = factory->last();
    EXPECT_GT(controller.loadGeneration(), genA);
    EXPECT_TRUE(a->destroyed);

    // A finishes decoding after B was assigned
    a->resolveLoad(7.0);
    drain(loop);
    EXPECT_EQ(snap().state, PlaybackState::Loading);
    EXPECT_DOUBLE_EQ(snap().totalDuration, 0.0);
    EXPECT_EQ(snap().sourceUrl.value_or(""), "b.wav");

    a->raiseError({ErrorKind::DecodeFailure, "late"});
    a->finish();
    EXPECT_EQ(snap().state, PlaybackState::Loading);

    b->resolveLoad(2.0);
    EXPECT_DOUBLE_EQ(snap().totalDuration, 2.0);
    EXPECT_EQ(snap().loadGeneration, controller.loadGeneration());
}

TEST_F(PlaybackControllerTest, TeardownOrderAndUrlRevocation) {
    std::string first = controller.assignClip(clip(1), "one");
    auto a = factory->last();
    EXPECT_TRUE(ObjectUrlRegistry::isObjectUrl(first));
    EXPECT_EQ(snap().sourceId, "capture-1");
    EXPECT_EQ(registry->size(), 1u);

    std::string second = controller.assignClip(clip(2), "two");
    EXPECT_NE(first, second);
    EXPECT_FALSE(registry->resolve(first).has_value());
    EXPECT_TRUE(registry->resolve(second).has_value());
    EXPECT_EQ(registry->size(), 1u);

    std::vector<std::string> expected = {"load", "pause", "empty", "destroy"};
    EXPECT_EQ(a->calls, expected);

    controller.assignSource(std::nullopt);
    EXPECT_EQ(registry->size(), 0u);
}

TEST_F(PlaybackControllerTest, VolumeZeroMutes) {
    auto surface = loadPlaying("a.wav", 3.0);

    controller.setVolume(0.0);
    EXPECT_TRUE(snap().muted());
    EXPECT_TRUE(surface->muted);

    controller.setVolume(0.5);
    EXPECT_FALSE(snap().muted());
    EXPECT_FALSE(surface->muted);
    EXPECT_DOUBLE_EQ(surface->volume, 0.5);

    controller.setVolume(4.0);
    EXPECT_DOUBLE_EQ(snap().volume, 1.0);
    controller.setVolume(-1.0);
    EXPECT_DOUBLE_EQ(snap().volume, 0.0);
}

TEST_F(PlaybackControllerTest, VolumeAppliesToNextSurface) {
    controller.setVolume(0.25);
    controller.assignSource(std::string("a.wav"));
    EXPECT_DOUBLE_EQ(factory->last()->volume, 0.25);
    EXPECT_FALSE(factory->last()->muted);

    controller.setVolume(0.0);
    controller.assignSource(std::string("b.wav"));
    EXPECT_TRUE(factory->last()->muted);
}

TEST_F(PlaybackControllerTest, LoopRestartsFromZero) {
    EXPECT_TRUE(controller.toggleLoop());
    auto surface = loadPlaying("a.wav", 3.0);

    surface->finish();
    EXPECT_DOUBLE_EQ(snap().currentTime, 0.0);
    ASSERT_FALSE(surface->seeks.empty());
    EXPECT_DOUBLE_EQ(surface->seeks.back(), 0.0);
    EXPECT_EQ(surface->playCalls, 2);

    drain(loop);
    EXPECT_EQ(snap().state, PlaybackState::Playing);
    EXPECT_FALSE(controller.toggleLoop());
}

TEST_F(PlaybackControllerTest, SeekByFraction) {
    auto surface = loadPlaying("a.wav", 10.0);

    EXPECT_TRUE(controller.seek(0.5));
    EXPECT_DOUBLE_EQ(snap().currentTime, 5.0);
    EXPECT_DOUBLE_EQ(surface->seeks.back(), 5.0);

    controller.seek(1.7);
    EXPECT_DOUBLE_EQ(snap().currentTime, 10.0);
    controller.seek(-0.2);
    EXPECT_DOUBLE_EQ(snap().currentTime, 0.0);
}

TEST_F(PlaybackControllerTest, AutoplayRejectionIsNotAnError) {
    controller.assignSource(std::string("a.wav"));
    auto surface = factory->last();
    surface->rejectPlay = AudioError{ErrorKind::PlaybackFailure, "no output device"};
    surface->resolveLoad(3.0);
    drain(loop);

    EXPECT_EQ(snap().state, PlaybackState::Ready);
    EXPECT_FALSE(snap().error.isError());

    // A failing play() the user asked for is an error
    EXPECT_TRUE(controller.play());
    drain(loop);
    EXPECT_EQ(snap().state, PlaybackState::Error);
    EXPECT_EQ(snap().error.kind, ErrorKind::PlaybackFailure);
    EXPECT_FALSE(controller.play());
}

TEST_F(PlaybackControllerTest, LoadFailureKinds) {
    controller.assignSource(std::string("missing.wav"));
    factory->last()->failLoad({ErrorKind::DeviceUnavailable, "404"});
    EXPECT_EQ(snap().state, PlaybackState::Error);
    EXPECT_EQ(snap().error.kind, ErrorKind::LoadFailure);

    controller.assignSource(std::string("junk.wav"));
    EXPECT_EQ(snap().state, PlaybackState::Loading);
    EXPECT_FALSE(snap().error.isError());
    factory->last()->failLoad({ErrorKind::DecodeFailure, "not audio"});
    EXPECT_EQ(snap().error.kind, ErrorKind::DecodeFailure);
}

TEST_F(PlaybackControllerTest, SurfaceErrorPausesAndDisablesTransport) {
    auto surface = loadPlaying("a.wav", 3.0);
    int pausesBefore = surface->pauseCalls;

    surface->raiseError({ErrorKind::PlaybackFailure, "stream died"});
    EXPECT_EQ(snap().state, PlaybackState::Error);
    EXPECT_EQ(surface->pauseCalls, pausesBefore + 1);
    EXPECT_FALSE(surface->destroyed);
    EXPECT_FALSE(controller.seek(0.5));

    controller.assignSource(std::string("b.wav"));
    EXPECT_TRUE(surface->destroyed);
}

TEST_F(PlaybackControllerTest, RendererInitFailure) {
    factory->failCreate = true;
    controller.assignClip(clip(9), "nine");

    EXPECT_EQ(snap().state, PlaybackState::Error);
    EXPECT_EQ(snap().error.kind, ErrorKind::RendererInitFailure);
    EXPECT_EQ(registry->size(), 0u);

    factory->failCreate = false;
    controller.assignSource(std::string("a.wav"));
    EXPECT_EQ(snap().state, PlaybackState::Loading);
}

TEST_F(PlaybackControllerTest, ClearingKeepsPreferences) {
    controller.setVolume(0.3);
    controller.setLoop(true);
    auto surface = loadPlaying("a.wav", 3.0);
    uint64_t before = controller.loadGeneration();

    controller.assignSource(std::nullopt);
    auto s = snap();
    EXPECT_EQ(s.state, PlaybackState::Empty);
    EXPECT_FALSE(s.sourceUrl.has_value());
    EXPECT_DOUBLE_EQ(s.totalDuration, 0.0);
    EXPECT_DOUBLE_EQ(s.volume, 0.3);
    EXPECT_TRUE(s.loopEnabled);
    EXPECT_GT(s.loadGeneration, before);
    EXPECT_TRUE(surface->destroyed);
    EXPECT_FALSE(controller.play());
}

TEST_F(PlaybackControllerTest, ListenersSeeEveryChange) {
    std::vector<PlaybackState> states;
    auto id = store.subscribe([&](const PlaybackSession& s) {
        if (states.empty() || states.back() != s.state) states.push_back(s.state);
    });

    loadPlaying("a.wav", 1.0);
    store.unsubscribe(id);
    controller.pause();
    drain(loop);

    std::vector<PlaybackState> expected = {
        PlaybackState::Loading, PlaybackState::Ready, PlaybackState::Playing};
    EXPECT_EQ(states, expected);
}

TEST_F(PlaybackControllerTest, ListenerReassigningOnReadyDoesNotTouchOldSurface) {
    controller.assignSource(std::string("a.wav"));
    auto a = factory->last();

    bool reassigned = false;
    store.subscribe([&](const PlaybackSession& s) {
        if (!reassigned && s.state == PlaybackState::Ready) {
            reassigned = true;
            controller.assignSource(std::string("b.wav"));
        }
    });

    a->resolveLoad(3.0);
    drain(loop);

    EXPECT_TRUE(reassigned);
    EXPECT_TRUE(a->destroyed);
    EXPECT_EQ(a->playCalls, 0);
    EXPECT_EQ(factory->surfaces.size(), 2u);
    EXPECT_EQ(factory->last()->playCalls, 0);
    EXPECT_EQ(snap().state, PlaybackState::Loading);
    EXPECT_EQ(snap().sourceUrl.value_or(""), "b.wav");
}

TEST_F(PlaybackControllerTest, ListenerClearingOnLoopRestartStopsTheRestart) {
    controller.setLoop(true);
    auto surface = loadPlaying("a.wav", 3.0);
    int playsBefore = surface->playCalls;

    // Fires on the rewind to zero that a looping finish performs
    bool armed = true;
    store.subscribe([&](const PlaybackSession& s) {
        if (armed && s.currentTime == 0.0) {
            armed = false;
            controller.assignSource(std::nullopt);
        }
    });

    surface->finish();
    drain(loop);

    EXPECT_FALSE(armed);
    EXPECT_TRUE(surface->destroyed);
    EXPECT_EQ(surface->playCalls, playsBefore);
    EXPECT_TRUE(surface->seeks.empty());
    EXPECT_EQ(snap().state, PlaybackState::Empty);
}

TEST_F(PlaybackControllerTest, SessionJson) {
    loadPlaying("a.wav", 2.0);
    auto j = snap().toJson();
    EXPECT_EQ(j["source"], "a.wav");
    EXPECT_EQ(j["state"], "Playing");
    EXPECT_EQ(j["duration"], 2.0);
    EXPECT_EQ(j["muted"], false);
}
