#pragma once

#include <string_view>

namespace brainforge::schema {

// MySQL 8 schema, version 1. Timestamps are Unix milliseconds (BIGINT).

inline constexpr std::string_view V1_SCHEMA = R"SQL(

CREATE TABLE IF NOT EXISTS schema_version (
    version INT NOT NULL PRIMARY KEY,
    applied_at DATETIME DEFAULT CURRENT_TIMESTAMP
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

CREATE TABLE IF NOT EXISTS brain_events (
    event_id BIGINT UNSIGNED AUTO_INCREMENT PRIMARY KEY,
    run_id VARCHAR(64) NOT NULL,
    event_type VARCHAR(64) NOT NULL,
    serialized_event LONGTEXT NULL,
    blob_key VARCHAR(512) NULL,
    created_at BIGINT NOT NULL,
    INDEX idx_events_run (run_id, event_id),
    INDEX idx_events_run_type (run_id, event_type, event_id)
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

CREATE TABLE IF NOT EXISTS brain_signals (
    signal_rowid BIGINT UNSIGNED AUTO_INCREMENT PRIMARY KEY,
    run_id VARCHAR(64) NOT NULL,
    signal_id VARCHAR(64) NOT NULL,
    signal_type VARCHAR(32) NOT NULL,
    kind VARCHAR(16) NOT NULL,
    payload LONGTEXT NOT NULL,
    webhook_slug VARCHAR(255) NULL,
    webhook_identifier VARCHAR(255) NULL,
    queued_at BIGINT NOT NULL,
    INDEX idx_signals_run (run_id, kind, signal_rowid)
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

CREATE TABLE IF NOT EXISTS waiting_webhooks (
    slug VARCHAR(255) NOT NULL,
    identifier VARCHAR(255) NOT NULL,
    run_id VARCHAR(64) NOT NULL,
    token VARCHAR(128) NULL,
    created_at BIGINT NOT NULL,
    PRIMARY KEY (slug, identifier),
    INDEX idx_waiting_run (run_id)
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

CREATE TABLE IF NOT EXISTS brain_runs (
    run_id VARCHAR(64) NOT NULL PRIMARY KEY,
    brain_title VARCHAR(255) NOT NULL,
    status VARCHAR(32) NOT NULL,
    error TEXT NULL,
    created_at BIGINT NOT NULL,
    started_at BIGINT NOT NULL DEFAULT 0,
    completed_at BIGINT NOT NULL DEFAULT 0,
    INDEX idx_runs_created (created_at)
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

CREATE TABLE IF NOT EXISTS run_timeouts (
    run_id VARCHAR(64) NOT NULL PRIMARY KEY,
    deadline_ms BIGINT NOT NULL
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

CREATE TABLE IF NOT EXISTS pages (
    slug VARCHAR(255) NOT NULL PRIMARY KEY,
    run_id VARCHAR(64) NOT NULL,
    persist TINYINT NOT NULL DEFAULT 0,
    created_at BIGINT NOT NULL,
    INDEX idx_pages_run (run_id)
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

)SQL";

inline constexpr int CURRENT_SCHEMA_VERSION = 1;

} // namespace brainforge::schema
