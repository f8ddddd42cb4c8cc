#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include "resonant/configuration.hpp"

namespace resonant {

namespace arg {

    /**
     * Ranking parameters. Defaults are taken from `RESONANT_*` environment variables, if set,
     * and can be overridden on the command line.
     */
    struct Scoring {
        explicit Scoring(CLI::App* app);
        [[nodiscard]] auto engine_config() const -> EngineConfig;

      private:
        EngineConfig m_config{};
        bool m_no_quantum = false;
        bool m_no_persistence = false;
    };

    struct Crawl {
        explicit Crawl(CLI::App* app);
        [[nodiscard]] auto crawler_config() const -> CrawlerConfig;

      private:
        CrawlerConfig m_config{};
        std::int64_t m_crawl_delay_ms = 0;
        std::vector<std::string> m_allowed_domains{};
        bool m_ignore_noindex = false;
        bool m_ignore_nofollow = false;
    };

    /// Where documents come from: seed URLs to crawl and/or a local directory.
    struct Sources {
        explicit Sources(CLI::App* app);

        /// Seed URLs given with `--seed` followed by those read from `--seeds-file`.
        [[nodiscard]] auto seeds() const -> std::vector<std::string>;
        [[nodiscard]] auto directory() const -> std::optional<std::string> const&;

      private:
        std::vector<std::string> m_seeds{};
        std::optional<std::string> m_seeds_file{};
        std::optional<std::string> m_directory{};
    };

    struct Search {
        explicit Search(CLI::App* app);
        [[nodiscard]] auto k() const -> std::size_t { return m_k; }
        [[nodiscard]] auto jump_importance() const -> double { return m_jump_importance; }

      private:
        std::size_t m_k = 5;
        double m_jump_importance = 0.2;
    };

    struct LogLevel {
        static const std::set<std::string> VALID_LEVELS;
        static const std::map<std::string, spdlog::level::level_enum> ENUM_MAP;

        explicit LogLevel(CLI::App* app);
        [[nodiscard]] auto log_level() const -> spdlog::level::level_enum;

      private:
        std::string m_level = "info";
    };

}  // namespace arg

/**
 * A declarative way to define CLI interface. This class inherits from `CLI::App` and therefore it
 * can be used like a regular `CLI::App` object once it is defined. This way, we can have a
 * declarative base with the ability to customize it.
 */
template <typename... Args>
struct App: public CLI::App, public Args... {
    explicit App(std::string const& description) : CLI::App(description), Args(this)... {
        this->set_config("--config", "", "Configuration .ini file", false);
    }
};

template <typename... T>
struct Args: public T... {
    explicit Args(CLI::App* app) : T(app)... {
        app->set_config("--config", "", "Configuration .ini file", false);
    }
};

}  // namespace resonant
