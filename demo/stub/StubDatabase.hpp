#pragma once

#include "../models/QueryModels.hpp"
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <thread>

/**
 * @brief Заглушка базы данных для демонстрации
 *
 * Имитирует таблицу products из totalRows строк:
 * - Каждый запрос стоит queryDelay (имитация нагрузки на БД)
 * - Считает выполненные запросы — именно их экономит кэш
 *
 * Данные детерминированы: строка id имеет цену 10 + id % 90.
 */
class StubDatabase {
public:
    /**
     * @param totalRows Количество строк в таблице
     * @param queryDelay Задержка каждого запроса
     */
    explicit StubDatabase(int totalRows = 1000,
                          std::chrono::milliseconds queryDelay = std::chrono::milliseconds(0))
        : totalRows_(totalRows)
        , queryDelay_(queryDelay)
    {
        if (totalRows_ < 0) {
            throw std::invalid_argument("Row count cannot be negative");
        }
    }

    /**
     * @brief Выполнить постраничный запрос
     * @throws std::invalid_argument при некорректных параметрах страницы
     */
    QueryResult fetchPage(const PageQuery& query) {
        if (query.page < 1 || query.pageSize < 1) {
            throw std::invalid_argument("Page and page size must be positive");
        }

        ++queryCount_;
        if (queryDelay_.count() > 0) {
            std::this_thread::sleep_for(queryDelay_);
        }

        QueryResult result;
        result.sql = "SELECT id, title, price FROM products ORDER BY id LIMIT " +
                     std::to_string(query.pageSize) + " OFFSET " +
                     std::to_string(query.offset());
        result.totalRows = totalRows_;

        for (int id = query.offset() + 1;
             id <= totalRows_ && id <= query.offset() + query.pageSize; ++id) {
            result.rows.push_back(ProductRow{id, "Product #" + std::to_string(id),
                                             10.0 + id % 90});
        }
        return result;
    }

    uint64_t queryCount() const { return queryCount_; }
    void resetStats() { queryCount_ = 0; }

private:
    int totalRows_;
    std::chrono::milliseconds queryDelay_;
    uint64_t queryCount_ = 0;
};
