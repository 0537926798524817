#include "transcript.hpp"

void Transcript::append(LineType type, const std::string& text) {
    close_open();
    records_.push_back({type, text, false});
    notify(text);
}

void Transcript::append_fragment(LineType type, const std::string& text) {
    if (text.empty()) return;
    if (!records_.empty() && records_.back().open && records_.back().type == type) {
        records_.back().text += text;
    } else {
        close_open();
        records_.push_back({type, text, true});
    }
    notify(text);
}

void Transcript::close_open() {
    if (!records_.empty()) records_.back().open = false;
}

void Transcript::clear() {
    records_.clear();
    if (on_clear_) on_clear_();
}

void Transcript::notify(const std::string& added) {
    if (listener_) listener_(records_.size() - 1, records_.back(), added);
}
