#pragma once
#include "../../include/domain.hpp"

#include <string>
#include <vector>

namespace ml {

/**
 * @brief Доступ к каталогу записей бэкенда (реляционная БД).
 *
 * Реализуется снаружи; соединение с бэкендом только вызывает эти методы.
 */
class IDatabase {
public:
    virtual ~IDatabase() = default;

    virtual std::vector<Channel> get_channels() = 0;
    virtual std::vector<Tuner> get_tuners() = 0;
    virtual std::vector<Job> get_jobs(const Program& program) = 0;

    // Значение из таблицы settings бэкенда
    virtual std::string get_myth_setting(const std::string& key) = 0;

    // Заполняет schedule_id у нового расписания
    virtual void save_schedule(Schedule& schedule) = 0;
    virtual void delete_schedule(const Schedule& schedule) = 0;
};

}  /* namespace ml */
