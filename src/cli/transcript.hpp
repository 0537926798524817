#pragma once

#include <functional>
#include <string>
#include <vector>

enum class LineType {
    INPUT,
    OUTPUT,
    ERROR,
    SYSTEM,
};

struct TranscriptRecord {
    LineType type;
    std::string text;
    bool open = false;      // still receiving unframed fragments
};

// Ordered output records of the terminal. Only touched on the caller thread.
class Transcript {
public:
    // Called for every change: the record index and the text just added.
    using Listener = std::function<void(size_t index, const TranscriptRecord& record,
                                        const std::string& added)>;

    void set_listener(Listener listener) { listener_ = std::move(listener); }
    void set_clear_listener(std::function<void()> listener) { on_clear_ = std::move(listener); }

    // New closed record; closes any open one first.
    void append(LineType type, const std::string& text);

    // Stream data: extends the open record of the same type, or opens one.
    void append_fragment(LineType type, const std::string& text);

    void close_open();
    void clear();

    const std::vector<TranscriptRecord>& records() const { return records_; }
    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

private:
    std::vector<TranscriptRecord> records_;
    Listener listener_;
    std::function<void()> on_clear_;

    void notify(const std::string& added);
};
