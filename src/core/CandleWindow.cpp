#include "core/CandleWindow.hpp"

#include <algorithm>
#include <stdexcept>

namespace core {

CandleWindow::CandleWindow(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0U) {
        throw std::invalid_argument("CandleWindow capacity must be >= 1");
    }
}

bool CandleWindow::append(const domain::Candle& candle) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!candles_.empty() && candle.openTs <= candles_.back().openTs) {
        ++rejected_;
        return false;
    }
    candles_.push_back(candle);
    if (candles_.size() > capacity_) {
        candles_.pop_front();
    }
    return true;
}

void CandleWindow::loadInitial(const std::vector<domain::Candle>& ordered) {
    const auto skip = ordered.size() > capacity_ ? ordered.size() - capacity_ : 0U;

    std::lock_guard<std::mutex> lock(mutex_);
    candles_.assign(ordered.begin() + static_cast<std::ptrdiff_t>(skip), ordered.end());
}

std::vector<domain::Candle> CandleWindow::getAll() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {candles_.begin(), candles_.end()};
}

std::vector<domain::Candle> CandleWindow::lastN(std::size_t n) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto count = std::min(n, candles_.size());
    return {candles_.end() - static_cast<std::ptrdiff_t>(count), candles_.end()};
}

std::optional<domain::Candle> CandleWindow::getLatest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (candles_.empty()) {
        return std::nullopt;
    }
    return candles_.back();
}

std::optional<domain::TimestampSec> CandleWindow::lastTimestamp() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (candles_.empty()) {
        return std::nullopt;
    }
    return candles_.back().openTs;
}

std::optional<domain::TimestampSec> CandleWindow::firstTimestamp() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (candles_.empty()) {
        return std::nullopt;
    }
    return candles_.front().openTs;
}

bool CandleWindow::hasGap(std::int64_t step) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = std::adjacent_find(candles_.begin(), candles_.end(), [step](const auto& a, const auto& b) {
        return b.openTs - a.openTs != step;
    });
    return it != candles_.end();
}

std::size_t CandleWindow::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return candles_.size();
}

std::uint64_t CandleWindow::rejectedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rejected_;
}

}  // namespace core
