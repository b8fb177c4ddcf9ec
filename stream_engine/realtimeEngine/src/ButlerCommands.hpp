// ButlerCommands.hpp: commands accepted by the butler thread and the queue that carries them
//
// ButlerCommand is a tagged struct: `type` selects which of the payload
// fields are meaningful. Build commands with the static factories rather
// than filling fields by hand.
//
// CommandQueue is a bounded FIFO (mutex + condition variable):
// - trySend() fails immediately when the queue is full.
// - send() blocks until there is room.
// - tryReceive() never blocks; the butler drains it at the top of each cycle.
// Senders are control threads (main, tests). The audio thread never sends.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "RingBuffers.hpp"
#include "StreamTypes.hpp"

enum class ButlerCommandType {
    Run,
    Pause,
    WaitForCompletion,
    StreamAudioFile,
    StopStreaming,
    SeekStream,
    SetLoopRange,
    ClearLoopRange,
    SetVarispeed,
    UpdatePdcPreroll,
    RegisterCapture,
    RemoveCapture,
    Flush,
    FlushAll,
    SetBufferMargin,
    Shutdown
};

struct ButlerCommand {
    ButlerCommandType type = ButlerCommandType::Run;

    size_t      channel  = 0;
    std::string path;
    uint64_t    position = 0;     // Offset / seek target / preroll (frames)
    LoopRange   loop;
    Varispeed   varispeed;
    double      margin   = 1.0;

    // RegisterCapture / RemoveCapture / Flush
    CaptureId   captureId;
    std::unique_ptr<CaptureBufferConsumer> captureConsumer;
    double      sampleRate = 0.0;
    int         channels   = 0;

    static ButlerCommand run()               { return make(ButlerCommandType::Run); }
    static ButlerCommand pause()             { return make(ButlerCommandType::Pause); }
    static ButlerCommand waitForCompletion() { return make(ButlerCommandType::WaitForCompletion); }
    static ButlerCommand flushAll()          { return make(ButlerCommandType::FlushAll); }
    static ButlerCommand shutdown()          { return make(ButlerCommandType::Shutdown); }

    static ButlerCommand streamAudioFile(size_t channel, std::string path, uint64_t offset) {
        ButlerCommand c = make(ButlerCommandType::StreamAudioFile);
        c.channel = channel;
        c.path = std::move(path);
        c.position = offset;
        return c;
    }

    static ButlerCommand stopStreaming(size_t channel) {
        ButlerCommand c = make(ButlerCommandType::StopStreaming);
        c.channel = channel;
        return c;
    }

    static ButlerCommand seekStream(size_t channel, uint64_t position) {
        ButlerCommand c = make(ButlerCommandType::SeekStream);
        c.channel = channel;
        c.position = position;
        return c;
    }

    static ButlerCommand setLoopRange(size_t channel, uint64_t start, uint64_t end, size_t crossfade) {
        ButlerCommand c = make(ButlerCommandType::SetLoopRange);
        c.channel = channel;
        c.loop = LoopRange{start, end, crossfade};
        return c;
    }

    static ButlerCommand clearLoopRange(size_t channel) {
        ButlerCommand c = make(ButlerCommandType::ClearLoopRange);
        c.channel = channel;
        return c;
    }

    static ButlerCommand setVarispeed(size_t channel, PlayDirection direction, float speed) {
        ButlerCommand c = make(ButlerCommandType::SetVarispeed);
        c.channel = channel;
        c.varispeed = Varispeed{direction, speed};
        return c;
    }

    static ButlerCommand updatePdcPreroll(size_t channel, uint64_t preroll) {
        ButlerCommand c = make(ButlerCommandType::UpdatePdcPreroll);
        c.channel = channel;
        c.position = preroll;
        return c;
    }

    static ButlerCommand registerCapture(CaptureId id, std::unique_ptr<CaptureBufferConsumer> consumer,
                                         std::string path, double sampleRate, int channels) {
        ButlerCommand c = make(ButlerCommandType::RegisterCapture);
        c.captureId = id;
        c.captureConsumer = std::move(consumer);
        c.path = std::move(path);
        c.sampleRate = sampleRate;
        c.channels = channels;
        return c;
    }

    static ButlerCommand removeCapture(CaptureId id) {
        ButlerCommand c = make(ButlerCommandType::RemoveCapture);
        c.captureId = id;
        return c;
    }

    static ButlerCommand flush(CaptureId id) {
        ButlerCommand c = make(ButlerCommandType::Flush);
        c.captureId = id;
        return c;
    }

    static ButlerCommand setBufferMargin(double margin) {
        ButlerCommand c = make(ButlerCommandType::SetBufferMargin);
        c.margin = margin;
        return c;
    }

private:
    static ButlerCommand make(ButlerCommandType type) {
        ButlerCommand c;
        c.type = type;
        return c;
    }
};

inline const char* toString(ButlerCommandType type) {
    switch (type) {
        case ButlerCommandType::Run:               return "Run";
        case ButlerCommandType::Pause:             return "Pause";
        case ButlerCommandType::WaitForCompletion: return "WaitForCompletion";
        case ButlerCommandType::StreamAudioFile:   return "StreamAudioFile";
        case ButlerCommandType::StopStreaming:     return "StopStreaming";
        case ButlerCommandType::SeekStream:        return "SeekStream";
        case ButlerCommandType::SetLoopRange:      return "SetLoopRange";
        case ButlerCommandType::ClearLoopRange:    return "ClearLoopRange";
        case ButlerCommandType::SetVarispeed:      return "SetVarispeed";
        case ButlerCommandType::UpdatePdcPreroll:  return "UpdatePdcPreroll";
        case ButlerCommandType::RegisterCapture:   return "RegisterCapture";
        case ButlerCommandType::RemoveCapture:     return "RemoveCapture";
        case ButlerCommandType::Flush:             return "Flush";
        case ButlerCommandType::FlushAll:          return "FlushAll";
        case ButlerCommandType::SetBufferMargin:   return "SetBufferMargin";
        case ButlerCommandType::Shutdown:          return "Shutdown";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// CommandQueue
// ─────────────────────────────────────────────────────────────────────────────

class CommandQueue {
public:
    explicit CommandQueue(size_t capacity) : mCapacity(capacity == 0 ? 1 : capacity) {}

    CommandQueue(const CommandQueue&) = delete;
    CommandQueue& operator=(const CommandQueue&) = delete;

    size_t capacity() const { return mCapacity; }

    /// Enqueue without waiting. Returns false (and leaves `cmd` untouched)
    /// when the queue is full.
    bool trySend(ButlerCommand& cmd) {
        {
            std::lock_guard<std::mutex> lock(mMutex);
            if (mQueue.size() >= mCapacity) return false;
            mQueue.push_back(std::move(cmd));
        }
        return true;
    }

    bool trySend(ButlerCommand&& cmd) { return trySend(cmd); }

    /// Enqueue, waiting for room if the queue is full.
    void send(ButlerCommand cmd) {
        {
            std::unique_lock<std::mutex> lock(mMutex);
            mNotFull.wait(lock, [this] { return mQueue.size() < mCapacity; });
            mQueue.push_back(std::move(cmd));
        }
    }

    /// Dequeue without waiting. Returns false when empty.
    bool tryReceive(ButlerCommand& out) {
        {
            std::lock_guard<std::mutex> lock(mMutex);
            if (mQueue.empty()) return false;
            out = std::move(mQueue.front());
            mQueue.pop_front();
        }
        mNotFull.notify_one();
        return true;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mQueue.size();
    }

    bool empty() const { return size() == 0; }

private:
    const size_t              mCapacity;
    mutable std::mutex        mMutex;
    std::condition_variable   mNotFull;
    std::deque<ButlerCommand> mQueue;
};
