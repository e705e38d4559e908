#pragma once
#include "capture/CaptureService.hpp"
#include "core/EventLoop.hpp"
#include "playback/PlaybackController.hpp"
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ftxui { class ScreenInteractive; }

// Terminal front-end for capture and playback, rendered with ftxui.
//
// The UI thread never touches a state machine: key presses are posted to
// the event loop, and the loop mirrors what the panels show into a
// mutex-protected view, then asks the screen to redraw.
class StudioUI {
public:
    StudioUI(EventLoop& loop, CaptureService& capture,
             PlaybackController& playback,
             std::vector<BackendKind> available);
    ~StudioUI();

    // Blocks until [q]
    void run();
    void stop();

    void addLog(const std::string& msg);

private:
    struct CaptureView {
        std::string  backend = "-";
        CaptureState state = CaptureState::Idle;
        double       elapsed = 0;
        double       maxDuration = 0;
        std::string  error;
        std::string  lastClip;
    };

    // Loop thread
    void startRecording(BackendKind kind);
    void stopRecording();
    void cancelRecording();
    void playLastClip();
    void adjustVolume(double delta);
    void toggleMute();
    void seekBy(double fraction);
    void syncCapture();

    void redraw();

    EventLoop&               loop_;
    CaptureService&          capture_;
    PlaybackController&      playback_;
    std::vector<BackendKind> available_;

    std::shared_ptr<CaptureSession> session_;    // loop thread
    std::optional<CapturedClip>     lastClip_;   // loop thread
    double                          unmutedVolume_ = 1.0;

    mutable std::mutex       viewMtx_;
    CaptureView              captureView_;
    PlaybackSession          playView_;
    std::vector<float>       peaks_;
    std::vector<std::string> logs_;
    static constexpr size_t  maxLogs_ = 50;

    PlaybackStore::ListenerId              listener_ = 0;
    std::atomic<ftxui::ScreenInteractive*> screen_{nullptr};
    bool running_ = false;
};
