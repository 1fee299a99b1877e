//===----------------------------------------------------------------------===//
//
// Part of the Shake project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements EditBuffer.  Edits live in two ordered maps keyed by original
// offset; rendering walks the window once, copying untouched spans wholesale
// and splicing replacement and insertion text at their recorded offsets.
//
//===----------------------------------------------------------------------===//

#include "edit/EditBuffer.hpp"

#include <algorithm>
#include <iterator>

namespace shake::edit
{

EditBuffer::EditBuffer(std::string text)
    : original_(std::make_shared<const std::string>(std::move(text))), start_(0),
      end_(static_cast<uint32_t>(original_->size()))
{
}

EditBuffer::EditBuffer(std::shared_ptr<const std::string> original, uint32_t start, uint32_t end)
    : original_(std::move(original)), start_(start), end_(end)
{
}

EditBuffer EditBuffer::snip(uint32_t start, uint32_t end) const
{
    uint32_t s = std::clamp(start, start_, end_);
    uint32_t e = std::clamp(end, start_, end_);
    if (s > e)
        s = e;
    return EditBuffer(original_, s, e);
}

EditBuffer EditBuffer::clone() const
{
    return *this;
}

support::Expected<void> EditBuffer::checkRange(uint32_t start, uint32_t end) const
{
    if (start > end)
    {
        return support::makeError({}, "invalid edit range [" + std::to_string(start) + ", " +
                                          std::to_string(end) + ")");
    }
    if (start < start_ || end > end_)
    {
        return support::makeError({}, "edit range [" + std::to_string(start) + ", " +
                                          std::to_string(end) + ") is outside the buffer window [" +
                                          std::to_string(start_) + ", " + std::to_string(end_) + ")");
    }
    return {};
}

support::Expected<void> EditBuffer::overwrite(uint32_t start, uint32_t end, std::string text)
{
    if (auto range = checkRange(start, end); !range)
        return range;

    if (start == end)
    {
        if (text.empty())
            return {};
        return support::makeError({}, "cannot overwrite an empty range at offset " + std::to_string(start));
    }

    auto first = replacements_.lower_bound(start);
    if (first != replacements_.begin())
    {
        auto prev = std::prev(first);
        if (prev->second.end > start)
        {
            return support::makeError({}, "edit [" + std::to_string(start) + ", " + std::to_string(end) +
                                              ") overlaps an earlier edit at " +
                                              std::to_string(prev->first));
        }
    }

    auto last = first;
    for (; last != replacements_.end() && last->first < end; ++last)
    {
        if (last->second.end > end)
        {
            return support::makeError({}, "edit [" + std::to_string(start) + ", " + std::to_string(end) +
                                              ") overlaps an earlier edit at " +
                                              std::to_string(last->first));
        }
    }

    // Earlier edits fully inside the new range are superseded.
    replacements_.erase(first, last);
    insertions_.erase(insertions_.upper_bound(start), insertions_.lower_bound(end));

    replacements_.emplace(start, Replacement{end, std::move(text)});
    return {};
}

support::Expected<void> EditBuffer::remove(uint32_t start, uint32_t end)
{
    return overwrite(start, end, std::string());
}

support::Expected<void> EditBuffer::insert(uint32_t offset, std::string_view text)
{
    if (offset < start_ || offset >= end_)
    {
        return support::makeError({}, "cannot insert at offset " + std::to_string(offset) +
                                          " outside the buffer window [" + std::to_string(start_) +
                                          ", " + std::to_string(end_) + ")");
    }

    auto next = replacements_.upper_bound(offset);
    if (next != replacements_.begin())
    {
        auto prev = std::prev(next);
        if (prev->first < offset && prev->second.end > offset)
        {
            return support::makeError({}, "cannot insert at offset " + std::to_string(offset) +
                                              " inside an overwritten range");
        }
    }

    insertions_[offset].append(text);
    return {};
}

void EditBuffer::append(std::string_view text)
{
    appended_.append(text);
}

void EditBuffer::addSourcemapLocation(uint32_t offset)
{
    sourcemapLocations_.insert(offset);
}

std::string EditBuffer::toString() const
{
    const std::string &text = *original_;
    std::string out;
    out.reserve(end_ - start_ + appended_.size());

    uint32_t pos = start_;
    while (pos < end_)
    {
        if (auto ins = insertions_.find(pos); ins != insertions_.end())
            out += ins->second;

        if (auto rep = replacements_.find(pos); rep != replacements_.end())
        {
            out += rep->second.text;
            pos = rep->second.end;
            continue;
        }

        uint32_t next = end_;
        if (auto ins = insertions_.upper_bound(pos); ins != insertions_.end())
            next = std::min(next, ins->first);
        if (auto rep = replacements_.upper_bound(pos); rep != replacements_.end())
            next = std::min(next, rep->first);

        out.append(text, pos, next - pos);
        pos = next;
    }

    out += appended_;
    return out;
}

} // namespace shake::edit
