#pragma once
#include "IWaveformSurface.hpp"
#include "ObjectUrlRegistry.hpp"
#include "PlaybackStore.hpp"
#include "capture/CaptureTypes.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Binds one waveform surface at a time to the shared PlaybackStore.
//
//   Empty → Loading → Ready → Playing ⇄ Paused
//   Ready / Playing / Paused → Loading    new source
//   any → Error                           init / load / decode / playback failure
//   Ready / Playing / Paused / Error → Empty   source cleared
//
// Each assignment bumps loadGeneration and fully tears down the previous
// binding before the new surface is created. Surface callbacks are tagged
// with the generation they were issued under and dropped when it is no
// longer current.
class PlaybackController {
public:
    PlaybackController(PlaybackStore& store,
                       std::shared_ptr<IWaveformSurfaceFactory> factory,
                       std::shared_ptr<ObjectUrlRegistry> registry,
                       const SurfaceConfig& surfaceConfig = {});
    ~PlaybackController();

    PlaybackController(const PlaybackController&) = delete;
    PlaybackController& operator=(const PlaybackController&) = delete;

    // nullopt clears the source (→ Empty). id and title are display only.
    void assignSource(const std::optional<std::string>& url,
                      const std::string& id = "", const std::string& title = "");

    // Registers the clip as an object URL owned by the new binding.
    std::string assignClip(const CapturedClip& clip, const std::string& title);

    // Transport; false when there is no decoded media.
    bool play();
    bool pause();
    bool togglePlayPause();
    bool seek(double fraction);          // clamped to [0, 1]

    void setVolume(double volume);       // clamped to [0, 1]; 0 mutes
    bool toggleLoop();                   // returns the new setting
    void setLoop(bool enabled);

    uint64_t loadGeneration() const { return generation_; }
    std::vector<float> peaks() const;
    PlaybackStore& store() { return store_; }

private:
    struct Binding {
        uint64_t                          generation = 0;
        std::unique_ptr<IWaveformSurface> surface;
        std::vector<std::string>          objectUrls;
    };

    void teardown();
    void wire(IWaveformSurface& surface, uint64_t generation);
    bool isCurrent(uint64_t generation) const;

    void handleLoaded(uint64_t generation, const std::optional<AudioError>& err);
    void handleReady(uint64_t generation, double duration);
    void handleFinish(uint64_t generation);
    void failWith(uint64_t generation, const AudioError& err);

    PlaybackStore&                           store_;
    std::shared_ptr<IWaveformSurfaceFactory> factory_;
    std::shared_ptr<ObjectUrlRegistry>       registry_;
    SurfaceConfig                            surfaceConfig_;

    uint64_t                 generation_ = 0;
    std::unique_ptr<Binding> binding_;
    std::vector<std::string> pendingUrls_;   // handed to the next binding
};
