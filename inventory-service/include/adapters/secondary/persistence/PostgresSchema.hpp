#pragma once

namespace inventory::adapters::secondary {

/**
 * @brief Схема складского ядра
 *
 * products / locations / tenants принадлежат каталогу; здесь они
 * создаются только если их ещё нет (локальный запуск, интеграционные тесты).
 */
inline constexpr const char* INVENTORY_SCHEMA = R"(
    CREATE TABLE IF NOT EXISTS tenants (
        id VARCHAR(64) PRIMARY KEY,
        default_pricing_method VARCHAR(16)
    );

    CREATE TABLE IF NOT EXISTS products (
        id VARCHAR(64) PRIMARY KEY,
        tenant_id VARCHAR(64) NOT NULL,
        name VARCHAR(255) NOT NULL,
        sku VARCHAR(128) NOT NULL,
        product_type VARCHAR(16) NOT NULL DEFAULT 'SIMPLE',
        pricing_method VARCHAR(16),
        reorder_level BIGINT NOT NULL DEFAULT 0,
        deleted_at TIMESTAMPTZ
    );

    CREATE TABLE IF NOT EXISTS locations (
        id VARCHAR(64) PRIMARY KEY,
        tenant_id VARCHAR(64) NOT NULL,
        name VARCHAR(255) NOT NULL,
        code VARCHAR(64),
        is_active BOOLEAN NOT NULL DEFAULT TRUE
    );

    CREATE TABLE IF NOT EXISTS inventory_balances (
        tenant_id VARCHAR(64) NOT NULL,
        product_id VARCHAR(64) NOT NULL,
        location_id VARCHAR(64) NOT NULL,
        on_hand_quantity BIGINT NOT NULL DEFAULT 0,
        reserved_quantity BIGINT NOT NULL DEFAULT 0,
        updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
        PRIMARY KEY (tenant_id, product_id, location_id)
    );

    CREATE TABLE IF NOT EXISTS stock_movements (
        id VARCHAR(64) PRIMARY KEY,
        tenant_id VARCHAR(64) NOT NULL,
        product_id VARCHAR(64) NOT NULL,
        location_id VARCHAR(64) NOT NULL,
        movement_type VARCHAR(8) NOT NULL,
        quantity BIGINT NOT NULL CHECK (quantity > 0),
        unit_cost NUMERIC(12,4) NOT NULL,
        total_cost NUMERIC(14,4) NOT NULL,
        reference_type VARCHAR(16) NOT NULL,
        reference_id VARCHAR(128),
        note TEXT,
        costing_method VARCHAR(16),
        transfer_id VARCHAR(64),
        created_by_id VARCHAR(64) NOT NULL,
        created_at TIMESTAMPTZ NOT NULL
    );
    ALTER TABLE products ADD COLUMN IF NOT EXISTS reorder_level BIGINT NOT NULL DEFAULT 0;

    CREATE INDEX IF NOT EXISTS idx_stock_movements_transfer ON stock_movements (tenant_id, transfer_id);

    CREATE TABLE IF NOT EXISTS valuation_layers (
        seq BIGSERIAL UNIQUE,
        id VARCHAR(64) PRIMARY KEY,
        tenant_id VARCHAR(64) NOT NULL,
        product_id VARCHAR(64) NOT NULL,
        location_id VARCHAR(64) NOT NULL,
        original_qty BIGINT NOT NULL,
        remaining_qty BIGINT NOT NULL CHECK (remaining_qty >= 0),
        unit_cost NUMERIC(12,4) NOT NULL CHECK (unit_cost >= 0),
        source_movement_id VARCHAR(64) NOT NULL,
        batch_id VARCHAR(128),
        created_at TIMESTAMPTZ NOT NULL
    );
    CREATE INDEX IF NOT EXISTS idx_valuation_layers_key
        ON valuation_layers (tenant_id, product_id, location_id, created_at, seq);

    CREATE TABLE IF NOT EXISTS valuation_layer_consumptions (
        id BIGSERIAL PRIMARY KEY,
        valuation_layer_id VARCHAR(64) NOT NULL REFERENCES valuation_layers(id),
        stock_movement_id VARCHAR(64) NOT NULL REFERENCES stock_movements(id),
        quantity BIGINT NOT NULL,
        unit_cost NUMERIC(12,4) NOT NULL
    );

    CREATE TABLE IF NOT EXISTS transfer_sequences (
        tenant_id VARCHAR(64) NOT NULL,
        year INT NOT NULL,
        last_value BIGINT NOT NULL,
        PRIMARY KEY (tenant_id, year)
    );

    CREATE TABLE IF NOT EXISTS stock_transfers (
        id VARCHAR(64) PRIMARY KEY,
        tenant_id VARCHAR(64) NOT NULL,
        transfer_number VARCHAR(32) NOT NULL,
        status VARCHAR(16) NOT NULL,
        from_location_id VARCHAR(64) NOT NULL,
        to_location_id VARCHAR(64) NOT NULL,
        note TEXT,
        created_by_id VARCHAR(64) NOT NULL,
        created_at TIMESTAMPTZ NOT NULL,
        shipped_at TIMESTAMPTZ,
        received_at TIMESTAMPTZ,
        cancelled_at TIMESTAMPTZ,
        UNIQUE (tenant_id, transfer_number),
        CHECK (from_location_id <> to_location_id)
    );

    CREATE TABLE IF NOT EXISTS stock_transfer_items (
        id VARCHAR(64) PRIMARY KEY,
        transfer_id VARCHAR(64) NOT NULL REFERENCES stock_transfers(id),
        position INT NOT NULL,
        product_id VARCHAR(64) NOT NULL,
        requested_quantity BIGINT NOT NULL,
        shipped_quantity BIGINT NOT NULL DEFAULT 0,
        shipped_unit_cost NUMERIC(12,4),
        received_quantity BIGINT NOT NULL DEFAULT 0,
        shortage_reason TEXT,
        UNIQUE (transfer_id, product_id)
    );

    CREATE TABLE IF NOT EXISTS stock_reservations (
        id VARCHAR(64) PRIMARY KEY,
        tenant_id VARCHAR(64) NOT NULL,
        product_id VARCHAR(64) NOT NULL,
        location_id VARCHAR(64) NOT NULL,
        quantity BIGINT NOT NULL CHECK (quantity > 0),
        expires_at TIMESTAMPTZ NOT NULL,
        status VARCHAR(16) NOT NULL,
        reference_type VARCHAR(64),
        reference_id VARCHAR(128),
        created_by_id VARCHAR(64) NOT NULL,
        created_at TIMESTAMPTZ NOT NULL
    );
    CREATE INDEX IF NOT EXISTS idx_stock_reservations_active ON stock_reservations (status);
)";

} // namespace inventory::adapters::secondary
