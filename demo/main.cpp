#include "services/CatalogService.hpp"
#include <evictcache/CacheConfig.hpp>
#include <evictcache/EvictionCache.hpp>
#include <evictcache/listeners/LoggingListener.hpp>
#include <iostream>
#include <iomanip>
#include <random>
#include <vector>

/**
 * @brief Демонстрация библиотеки на примере кэша страниц каталога
 *
 * Сценарии:
 * 1. Экономия запросов к БД
 * 2. Как каждая политика выбирает жертву
 * 3. Сравнение политик на одной нагрузке
 *
 * Необязательный аргумент: конфигурация кэша, например "lfu:64".
 */

void printSeparator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "  " << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

/**
 * @brief Демо 1: Экономия запросов к БД
 *
 * Пользователи листают первые страницы каталога.
 * Без кэша каждый просмотр = запрос к БД.
 */
void demoQuerySavings(const CacheConfig& config) {
    printSeparator("Demo 1: Query Savings (" + toString(config.policy) + ")");

    auto db = std::make_shared<StubDatabase>(1000);
    CatalogService service(db, config, &std::cout);

    const int views = 200;
    std::mt19937 rng(42);
    std::uniform_int_distribution<int> pageDist(1, 10);

    std::cout << "Serving " << views << " page views over 10 pages...\n\n";

    for (int i = 0; i < views; ++i) {
        PageQuery query{pageDist(rng), 20};
        auto page = service.getPage(query);
        if (i == 0) {
            std::cout << "First query: " << page.sql << "\n";
            std::cout << "Result: " << page << "\n\n";
        }
    }

    // Товар на первой странице изменился
    service.invalidate(PageQuery{1, 20});
    service.getPage(PageQuery{1, 20});

    service.printStats();
    std::cout << "\nWithout cache: " << (views + 1) << " DB queries\n";
}

/**
 * @brief Демо 2: Выбор жертвы
 *
 * Один и тот же сценарий для каждой политики:
 *   put A, B, C; get A; get A; get B; put D
 */
void demoVictimSelection() {
    printSeparator("Demo 2: Victim Selection");

    std::cout << "Scenario: put A, B, C; get A; get A; get B; put D\n\n";

    for (PolicyKind kind : allPolicyKinds()) {
        EvictionCache<std::string, int> cache(3, makeEvictionPolicy<std::string>(kind));
        cache.addListener(std::make_shared<LoggingListener<std::string, int>>(
            toString(kind), std::cout, LogLevel::Info));

        cache.put("A", 1);
        cache.put("B", 2);
        cache.put("C", 3);
        cache.get("A");
        cache.get("A");
        cache.get("B");
        cache.put("D", 4);
    }
}

/**
 * @brief Демо 3: Сравнение политик
 *
 * Смешанная нагрузка: популярные страницы + периодический
 * полный проход по каталогу (выгрузка, индексация поисковиком).
 */
void demoPolicyComparison(size_t capacity) {
    printSeparator("Demo 3: Policy Comparison (capacity " + std::to_string(capacity) + ")");

    std::cout << std::left << std::setw(8) << "Policy"
              << std::right << std::setw(12) << "Hit Rate"
              << std::setw(14) << "DB queries" << "\n";
    std::cout << std::string(34, '-') << "\n";

    for (PolicyKind kind : allPolicyKinds()) {
        CacheConfig config;
        config.policy = kind;
        config.capacity = capacity;

        auto db = std::make_shared<StubDatabase>(2000);
        CatalogService service(db, config);

        std::mt19937 rng(7);
        std::uniform_int_distribution<int> hotDist(1, 5);

        for (int round = 0; round < 20; ++round) {
            for (int i = 0; i < 50; ++i) {
                service.getPage(PageQuery{hotDist(rng), 20});
            }
            // Полный проход по каталогу
            for (int page = 1; page <= 100; ++page) {
                service.getPage(PageQuery{page, 20});
            }
        }

        std::cout << std::left << std::setw(8) << toString(kind)
                  << std::right << std::setw(11) << std::fixed << std::setprecision(1)
                  << (service.hitRate() * 100) << "%"
                  << std::setw(14) << db->queryCount() << "\n";
    }
}

int main(int argc, char* argv[]) {
    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════╗\n";
    std::cout << "║          EvictionCache Library Demo                      ║\n";
    std::cout << "║          Query Result Caching Example                    ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════╝\n";

    try {
        CacheConfig config;
        config.capacity = 8;
        if (argc > 1) {
            config = CacheConfig::fromString(argv[1]);
        }

        demoQuerySavings(config);
        demoVictimSelection();
        demoPolicyComparison(config.capacity);

        printSeparator("Demo Complete");
        std::cout << "All demos completed successfully!\n\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
