#pragma once
#include <mutex>
#include <string>
#include <vector>
#include <utility>
#include <variant>
#include <concepts>
#include <functional>

#include "domain.hpp"

namespace ml {

// Запись удалена на бэкенде (публикуется только после подтверждения сервера)
struct RecordingDeleted {
    Program program;
};

// Значение настройки изменилось
struct SettingChanged {
    std::string tag;
    std::string old_value;
    std::string new_value;
};

using Event = std::variant<RecordingDeleted, SettingChanged>;

template<typename Func, typename... Args>
concept SignalHandler = std::invocable<Func, Args...>;

/**
 * @brief Синхронный сигнал: подписчики вызываются в потоке публикации,
 * в порядке подписки.
 *
 * Исключение в подписчике логируется и не мешает доставке остальным.
 */
template<typename... Args>
class Signal {
public:
    using HandlerId = size_t;

    Signal() = default;
    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    template<typename Func>
    requires SignalHandler<Func, Args...>
    HandlerId connect(Func&& handler);

    void disconnect(HandlerId id);
    void emit(Args... args);

    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<HandlerId, std::function<void(Args...)>>> handlers_;
    HandlerId next_id_ = 1;
};

template<typename... Args>
template<typename Func>
requires SignalHandler<Func, Args...>
typename Signal<Args...>::HandlerId Signal<Args...>::connect(Func&& handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    HandlerId id = next_id_++;
    handlers_.emplace_back(id, std::forward<Func>(handler));
    return id;
}

/**
 * @brief Шина событий клиента.
 */
class EventBus : public Signal<const Event&> {
public:
    void publish(const Event& event) { emit(event); }
};

// Имя события для логов
const char* event_name(const Event& event);

} // namespace ml
