#include "ui/StudioUI.hpp"
#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdio>

using namespace ftxui;

namespace {

std::string formatTime(double secs) {
    int total = static_cast<int>(secs);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%d:%02d.%d", total / 60, total % 60,
                  static_cast<int>((secs - total) * 10));
    return buf;
}

Color stateColor(CaptureState s) {
    switch (s) {
        case CaptureState::Recording:        return Color::Red;
        case CaptureState::RequestingAccess:
        case CaptureState::Stopping:
        case CaptureState::Finalizing:       return Color::Yellow;
        case CaptureState::Completed:        return Color::Green;
        case CaptureState::Error:            return Color::RedLight;
        default:                             return Color::GrayLight;
    }
}

Color stateColor(PlaybackState s) {
    switch (s) {
        case PlaybackState::Playing: return Color::Green;
        case PlaybackState::Loading: return Color::Yellow;
        case PlaybackState::Error:   return Color::RedLight;
        case PlaybackState::Empty:   return Color::GrayDark;
        default:                     return Color::Cyan;
    }
}

// One block glyph per peak; the played part is highlighted
Element waveform(const std::vector<float>& peaks, double progress) {
    static const char* kBlocks[] = {"▁", "▂", "▃", "▄", "▅", "▆", "▇", "█"};
    if (peaks.empty()) return text("  (no waveform)") | dim;

    size_t played = static_cast<size_t>(std::clamp(progress, 0.0, 1.0) * peaks.size());
    std::string head, tail;
    for (size_t i = 0; i < peaks.size(); i++) {
        int level = std::clamp(static_cast<int>(peaks[i] * 7.0f + 0.5f), 0, 7);
        (i < played ? head : tail) += kBlocks[level];
    }
    return hbox({
        text(" "),
        text(head) | color(Color::Cyan),
        text(tail) | color(Color::GrayDark),
    });
}

} // namespace

StudioUI::StudioUI(EventLoop& loop, CaptureService& capture,
                   PlaybackController& playback,
                   std::vector<BackendKind> available)
    : loop_(loop), capture_(capture), playback_(playback),
      available_(std::move(available))
{
    playView_ = playback_.store().snapshot();
    unmutedVolume_ = playView_.volume > 0.0 ? playView_.volume : 1.0;

    // Runs on the writer's (loop) thread
    listener_ = playback_.store().subscribe([this](const PlaybackSession& s) {
        {
            std::lock_guard lock(viewMtx_);
            bool reloaded = s.loadGeneration != playView_.loadGeneration ||
                            s.state != playView_.state;
            playView_ = s;
            if (reloaded) peaks_ = playback_.peaks();
        }
        redraw();
    });
}

StudioUI::~StudioUI() {
    playback_.store().unsubscribe(listener_);
    stop();
}

void StudioUI::stop() {
    running_ = false;
}

void StudioUI::redraw() {
    if (auto* screen = screen_.load())
        screen->PostEvent(Event::Custom);
}

void StudioUI::addLog(const std::string& msg) {
    {
        std::lock_guard lock(viewMtx_);
        logs_.push_back(msg);
        if (logs_.size() > maxLogs_)
            logs_.erase(logs_.begin());
    }
    redraw();
}

void StudioUI::syncCapture() {
    {
        std::lock_guard lock(viewMtx_);
        if (session_) {
            captureView_.backend     = toString(session_->kind());
            captureView_.state       = session_->state();
            captureView_.elapsed     = session_->elapsedSeconds();
            captureView_.maxDuration = session_->maxDurationSeconds();
            captureView_.error       = session_->error().isError()
                                     ? session_->error().describe() : "";
        }
        if (lastClip_) {
            char buf[96];
            std::snprintf(buf, sizeof(buf), "%.2fs %s (%zu bytes)%s",
                          lastClip_->durationSeconds, lastClip_->mime.c_str(),
                          lastClip_->bytes.size(),
                          lastClip_->canonical ? "" : " [raw]");
            captureView_.lastClip = buf;
        }
    }
    redraw();
}

void StudioUI::startRecording(BackendKind kind) {
    if (std::find(available_.begin(), available_.end(), kind) == available_.end()) {
        addLog(toString(kind) + " capture is not available");
        return;
    }
    if (session_ && !isTerminal(session_->state()) &&
        session_->state() != CaptureState::Idle) {
        addLog("A recording is already in progress");
        return;
    }

    auto session = capture_.createSession(kind);
    if (!session) {
        addLog("No " + toString(kind) + " backend");
        return;
    }

    session->onStateChange = [this](CaptureState) { syncCapture(); };
    session->onElapsed     = [this](double) { syncCapture(); };
    session->onError = [this](const AudioError& err) {
        addLog("Capture failed: " + err.describe());
    };
    session->onComplete = [this](const CapturedClip& clip) {
        lastClip_ = clip;
        syncCapture();
        addLog("Captured " + formatTime(clip.durationSeconds) + " (" + clip.mime + ")");
    };

    session_ = session;
    if (!session->start())
        addLog("Start rejected: " + session->error().describe());
    else
        addLog("Recording " + toString(kind) + " audio");
    syncCapture();
}

void StudioUI::stopRecording() {
    if (session_ && session_->stop()) addLog("Stopping");
    syncCapture();
}

void StudioUI::cancelRecording() {
    if (session_ && session_->cancel()) addLog("Recording cancelled");
    syncCapture();
}

void StudioUI::playLastClip() {
    if (!lastClip_) {
        addLog("Nothing recorded yet");
        return;
    }
    playback_.assignClip(*lastClip_, "Take " + std::to_string(lastClip_->sessionId));
}

void StudioUI::adjustVolume(double delta) {
    double v = std::clamp(playback_.store().snapshot().volume + delta, 0.0, 1.0);
    playback_.setVolume(v);
    if (v > 0.0) unmutedVolume_ = v;
}

void StudioUI::toggleMute() {
    auto current = playback_.store().snapshot().volume;
    if (current > 0.0) {
        unmutedVolume_ = current;
        playback_.setVolume(0.0);
    } else {
        playback_.setVolume(unmutedVolume_);
    }
}

void StudioUI::seekBy(double fraction) {
    auto s = playback_.store().snapshot();
    if (s.totalDuration <= 0) return;
    playback_.seek(s.currentTime / s.totalDuration + fraction);
}

void StudioUI::run() {
    running_ = true;

    auto screen = ScreenInteractive::Fullscreen();
    screen_ = &screen;

    auto renderer = Renderer([&] {
        CaptureView cap;
        PlaybackSession play;
        std::vector<float> peaks;
        std::vector<std::string> logs;
        {
            std::lock_guard lock(viewMtx_);
            cap   = captureView_;
            play  = playView_;
            peaks = peaks_;
            logs  = logs_;
        }

        // ── Header ────────────────────────────────────────────────
        auto backendDot = [&](BackendKind k, const std::string& label) {
            bool ok = std::find(available_.begin(), available_.end(), k) != available_.end();
            return hbox({
                text(" * ") | bold | color(ok ? Color::Green : Color::Red),
                text(label) | (ok ? color(Color::Green) : color(Color::Red)),
            });
        };

        auto header = hbox({
            text(" voxdeck ") | bold | color(Color::Cyan) | inverted,
            text(" "),
            backendDot(BackendKind::Local, "Mic"),
            text("  "),
            backendDot(BackendKind::System, "System"),
            filler(),
        });

        // ── Capture panel ─────────────────────────────────────────
        float progress = cap.maxDuration > 0
                       ? static_cast<float>(cap.elapsed / cap.maxDuration) : 0.0f;
        auto capturePanel = vbox({
            text(" Capture") | bold,
            separator(),
            hbox({
                text("  " + cap.backend + "  "),
                text(toString(cap.state)) | bold | color(stateColor(cap.state)),
                filler(),
                text(formatTime(cap.elapsed) + " / " + formatTime(cap.maxDuration) + " "),
            }),
            hbox({ text("  "), gauge(progress) | color(Color::Red) | flex, text(" ") }),
            cap.error.empty() ? text("") : text("  " + cap.error) | color(Color::RedLight),
            cap.lastClip.empty() ? text("  No clip yet") | dim
                                 : text("  Last: " + cap.lastClip),
        }) | border;

        // ── Player panel ──────────────────────────────────────────
        double played = play.totalDuration > 0 ? play.currentTime / play.totalDuration : 0.0;
        std::string vol = play.muted() ? "muted"
                        : std::to_string(static_cast<int>(play.volume * 100 + 0.5)) + "%";
        auto playerPanel = vbox({
            text(" Player") | bold,
            separator(),
            hbox({
                text("  " + (play.title.empty() ? std::string("-") : play.title) + "  "),
                text(toString(play.state)) | bold | color(stateColor(play.state)),
                play.state == PlaybackState::Loading
                    ? text(" " + std::to_string(play.loadingPercent) + "%") | dim
                    : text(""),
                filler(),
                text(formatTime(play.currentTime) + " / " + formatTime(play.totalDuration) + " "),
            }),
            waveform(peaks, played),
            hbox({
                text("  vol " + vol),
                text(play.loopEnabled ? "  loop on" : "  loop off") |
                    color(play.loopEnabled ? Color::Green : Color::GrayDark),
                filler(),
            }),
            play.error.isError() ? text("  " + play.error.describe()) | color(Color::RedLight)
                                 : text(""),
        }) | border;

        // ── Activity log ──────────────────────────────────────────
        Elements logElements;
        size_t logStart = logs.size() > 10 ? logs.size() - 10 : 0;
        for (size_t i = logStart; i < logs.size(); i++)
            logElements.push_back(text("  " + logs[i]) | dim);
        if (logElements.empty())
            logElements.push_back(text("  Press r to record from the microphone") | dim);

        auto help = hbox({
            text(" [r] mic  [y] system  [s] stop  [c] cancel  [p] play take  "
                 "[space] play/pause  [</>] seek  [+/-] vol  [m] mute  [l] loop  "
                 "[x] clear  [q] quit ") | dim,
        }) | borderLight;

        return vbox({
            header,
            separator(),
            capturePanel,
            playerPanel,
            vbox({ text(" Activity") | bold, separator(), vbox(logElements) }) | border | flex,
            help,
        });
    });

    auto component = CatchEvent(renderer, [&](Event event) {
        if (event == Event::Custom) return false;

        if (event == Event::Character('q') || event == Event::Escape) {
            running_ = false;
            screen.Exit();
            return true;
        }

        EventLoop::Task action;
        if (event == Event::Character('r'))
            action = [this] { startRecording(BackendKind::Local); };
        else if (event == Event::Character('y'))
            action = [this] { startRecording(BackendKind::System); };
        else if (event == Event::Character('s'))
            action = [this] { stopRecording(); };
        else if (event == Event::Character('c'))
            action = [this] { cancelRecording(); };
        else if (event == Event::Character('p'))
            action = [this] { playLastClip(); };
        else if (event == Event::Character(' '))
            action = [this] { playback_.togglePlayPause(); };
        else if (event == Event::ArrowLeft)
            action = [this] { seekBy(-0.1); };
        else if (event == Event::ArrowRight)
            action = [this] { seekBy(0.1); };
        else if (event == Event::Character('+') || event == Event::Character('='))
            action = [this] { adjustVolume(0.1); };
        else if (event == Event::Character('-'))
            action = [this] { adjustVolume(-0.1); };
        else if (event == Event::Character('m'))
            action = [this] { toggleMute(); };
        else if (event == Event::Character('l'))
            action = [this] {
                addLog(playback_.toggleLoop() ? "Loop on" : "Loop off");
            };
        else if (event == Event::Character('x'))
            action = [this] { playback_.assignSource(std::nullopt); };

        if (!action) return false;
        loop_.post(std::move(action));
        return true;
    });

    screen.Loop(component);
    screen_ = nullptr;
}
