#pragma once

#include <string>
#include <vector>
#include <ostream>

/**
 * @brief Модели данных для кэша результатов запросов
 *
 * Каталог товаров листается постранично:
 *   SELECT id, title, price FROM products ORDER BY id LIMIT <size> OFFSET <offset>
 *
 * Ключ кэша — нормализованный текст запроса (PageQuery::key()),
 * значение — готовая страница результата.
 */

/**
 * @brief Строка таблицы products
 */
struct ProductRow {
    int id;
    std::string title;
    double price;
};

/**
 * @brief Параметры постраничного запроса
 */
struct PageQuery {
    int page;       // номер страницы, начиная с 1
    int pageSize;   // строк на странице

    int offset() const {
        return (page - 1) * pageSize;
    }

    /**
     * @brief Ключ кэша: одинаковые запросы дают одинаковый ключ
     */
    std::string key() const {
        return "products?limit=" + std::to_string(pageSize) +
               "&offset=" + std::to_string(offset());
    }
};

/**
 * @brief Результат запроса — одна страница
 */
struct QueryResult {
    std::string sql;
    std::vector<ProductRow> rows;
    int totalRows = 0;
};

/**
 * @brief Краткий вывод для LoggingListener
 */
inline std::ostream& operator<<(std::ostream& os, const QueryResult& result) {
    os << "<" << result.rows.size() << " rows";
    if (!result.rows.empty()) {
        os << ", ids " << result.rows.front().id << ".." << result.rows.back().id;
    }
    return os << ">";
}
