#pragma once

#include "../models/QueryModels.hpp"
#include "../stub/StubDatabase.hpp"
#include <evictcache/CacheConfig.hpp>
#include <evictcache/listeners/LoggingListener.hpp>
#include <evictcache/listeners/StatsListener.hpp>
#include <iomanip>
#include <iostream>
#include <memory>

/**
 * @brief Сервис каталога с кэшем результатов запросов
 *
 * Cache-aside:
 * - Ищем страницу в кэше по ключу запроса
 * - При промахе идём в БД и кладём результат в кэш
 *
 * Политика и ёмкость берутся из CacheConfig, поэтому одну и ту же
 * нагрузку можно прогнать с разными политиками.
 */
class CatalogService {
public:
    /**
     * @param db База данных (реальная или заглушка)
     * @param config Конфигурация кэша страниц
     * @param log Поток для логирования вытеснений (nullptr — без логов)
     */
    CatalogService(std::shared_ptr<StubDatabase> db,
                   const CacheConfig& config,
                   std::ostream* log = nullptr)
        : db_(std::move(db))
        , pageCache_(makeCache<std::string, QueryResult>(config))
        , stats_(std::make_shared<StatsListener<std::string, QueryResult>>())
    {
        if (!db_) {
            throw std::invalid_argument("Database cannot be null");
        }
        pageCache_->addListener(stats_);
        if (log) {
            pageCache_->addListener(std::make_shared<LoggingListener<std::string, QueryResult>>(
                "pages/" + pageCache_->policyName(), *log, LogLevel::Info));
        }
    }

    /**
     * @brief Получить страницу каталога
     */
    QueryResult getPage(const PageQuery& query) {
        const std::string key = query.key();

        auto cached = pageCache_->get(key);
        if (cached.has_value()) {
            return cached.value();
        }

        auto result = db_->fetchPage(query);
        pageCache_->put(key, result);
        return result;
    }

    /**
     * @brief Сбросить страницу после изменения данных
     */
    bool invalidate(const PageQuery& query) {
        return pageCache_->remove(query.key());
    }

    // ==================== Статистика ====================

    double hitRate() const {
        return stats_->hitRate();
    }

    void printStats() const {
        std::cout << "Page cache (" << pageCache_->policyName()
                  << ", capacity " << pageCache_->capacity() << "):\n";
        std::cout << "  Hits:      " << stats_->hits() << "\n";
        std::cout << "  Misses:    " << stats_->misses() << "\n";
        std::cout << "  Evictions: " << stats_->evictions() << "\n";
        std::cout << "  Hit Rate:  " << std::fixed << std::setprecision(1)
                  << (stats_->hitRate() * 100) << "%\n";
        std::cout << "  DB queries: " << db_->queryCount() << "\n";
    }

private:
    std::shared_ptr<StubDatabase> db_;
    std::unique_ptr<EvictionCache<std::string, QueryResult>> pageCache_;
    std::shared_ptr<StatsListener<std::string, QueryResult>> stats_;
};
