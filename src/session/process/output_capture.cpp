/*
 * output_capture.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "output_capture.hpp"

namespace tandem::session {

namespace {

std::string trimCarriageReturn(std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

}  // namespace

std::vector<std::string> OutputCapture::append(OutputStream stream,
                                               std::string_view chunk) {
    std::vector<std::string> completed;
    std::lock_guard lock(mutex_);
    auto& st = state(stream);

    size_t start = 0;
    while (start < chunk.size()) {
        auto newline = chunk.find('\n', start);
        if (newline == std::string_view::npos) {
            st.partial.append(chunk.substr(start));
            break;
        }
        st.partial.append(chunk.substr(start, newline - start));
        completed.push_back(trimCarriageReturn(std::move(st.partial)));
        st.partial.clear();
        start = newline + 1;
    }

    if (!completed.empty()) {
        st.lines.insert(st.lines.end(), completed.begin(), completed.end());
        ++version_;
    }
    return completed;
}

std::vector<std::string> OutputCapture::finish() {
    std::vector<std::string> flushed;
    std::lock_guard lock(mutex_);
    for (auto* st : {&stdout_, &stderr_}) {
        if (!st->partial.empty()) {
            st->lines.push_back(trimCarriageReturn(std::move(st->partial)));
            flushed.push_back(st->lines.back());
            st->partial.clear();
            ++version_;
        }
    }
    return flushed;
}

CaptureSnapshot OutputCapture::snapshot() const {
    std::lock_guard lock(mutex_);
    return CaptureSnapshot{stdout_.lines, stderr_.lines, version_};
}

std::uint64_t OutputCapture::version() const {
    std::lock_guard lock(mutex_);
    return version_;
}

}  // namespace tandem::session
