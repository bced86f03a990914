#include "signals.hpp"
#include "logger.hpp"

#include <algorithm>

namespace ml {

LOGGER("EVENT");

template<typename... Args>
void Signal<Args...>::emit(Args... args) {
    std::vector<std::pair<HandlerId, std::function<void(Args...)>>> handlers_copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_copy = handlers_;
    }

    logger.debug("Signal emitting to {} handlers", handlers_copy.size());

    for (auto& [id, handler] : handlers_copy) {
        try {
            handler(args...);
        } catch (const std::exception& e) {
            logger.error("Signal handler {} error: {}", id, e.what());
        }
    }
}

template<typename... Args>
void Signal<Args...>::disconnect(HandlerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(handlers_.begin(), handlers_.end(),
                           [id](const auto& entry) { return entry.first == id; });
    if (it != handlers_.end()) {
        handlers_.erase(it);
    } else {
        logger.warning("disconnect: no handler with id {}", id);
    }
}

template<typename... Args>
size_t Signal<Args...>::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.size();
}

const char* event_name(const Event& event) {
    return std::visit([](const auto& e) -> const char* {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, RecordingDeleted>) {
            return "RECORDING_DELETED";
        } else {
            return "SETTING_CHANGED";
        }
    }, event);
}

// Явное инстанцирование для шины событий
template class Signal<const Event&>;

} // namespace ml
