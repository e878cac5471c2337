#include "adapters/secondary/persistence/PostgresRepositories.hpp"
#include "adapters/secondary/persistence/PostgresErrors.hpp"

#include <optional>
#include <sstream>

namespace inventory::adapters::secondary {

using domain::Money;
using domain::Timestamp;

namespace {

// Метки времени хранятся как TIMESTAMPTZ, по проводу идут миллисекундами эпохи
const char* const LAYER_COLUMNS =
    "id, tenant_id, product_id, location_id, original_qty, remaining_qty, unit_cost::text AS unit_cost, "
    "source_movement_id, batch_id, (EXTRACT(EPOCH FROM created_at) * 1000)::bigint AS created_at_ms";

const char* const MOVEMENT_COLUMNS =
    "id, tenant_id, product_id, location_id, movement_type, quantity, "
    "unit_cost::text AS unit_cost, total_cost::text AS total_cost, reference_type, reference_id, note, "
    "costing_method, transfer_id, created_by_id, (EXTRACT(EPOCH FROM created_at) * 1000)::bigint AS created_at_ms";

const char* const RESERVATION_COLUMNS =
    "id, tenant_id, product_id, location_id, quantity, "
    "(EXTRACT(EPOCH FROM expires_at) * 1000)::bigint AS expires_at_ms, status, reference_type, reference_id, "
    "created_by_id, (EXTRACT(EPOCH FROM created_at) * 1000)::bigint AS created_at_ms";

std::optional<std::string> optionalText(const pqxx::field& field) {
    if (field.is_null()) {
        return std::nullopt;
    }
    return field.as<std::string>();
}

std::optional<Timestamp> optionalTime(const pqxx::field& field) {
    if (field.is_null()) {
        return std::nullopt;
    }
    return Timestamp::fromEpochMillis(field.as<int64_t>());
}

std::optional<int64_t> millisParam(const std::optional<Timestamp>& ts) {
    if (!ts) {
        return std::nullopt;
    }
    return ts->epochMillis();
}

std::optional<std::string> moneyParam(const std::optional<Money>& money) {
    if (!money) {
        return std::nullopt;
    }
    return money->toString();
}

/// 'id1', 'id2', ... для IN (...)
std::string quotedList(pqxx::work& txn, const std::vector<std::string>& ids) {
    std::ostringstream ss;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << txn.quote(ids[i]);
    }
    return ss.str();
}

domain::Balance toBalance(const pqxx::row& row) {
    domain::Balance balance;
    balance.tenantId = row["tenant_id"].as<std::string>();
    balance.productId = row["product_id"].as<std::string>();
    balance.locationId = row["location_id"].as<std::string>();
    balance.onHandQuantity = row["on_hand_quantity"].as<int64_t>();
    balance.reservedQuantity = row["reserved_quantity"].as<int64_t>();
    return balance;
}

domain::ValuationLayer toLayer(const pqxx::row& row) {
    domain::ValuationLayer layer;
    layer.id = row["id"].as<std::string>();
    layer.tenantId = row["tenant_id"].as<std::string>();
    layer.productId = row["product_id"].as<std::string>();
    layer.locationId = row["location_id"].as<std::string>();
    layer.originalQty = row["original_qty"].as<int64_t>();
    layer.remainingQty = row["remaining_qty"].as<int64_t>();
    layer.unitCost = Money::fromString(row["unit_cost"].as<std::string>());
    layer.sourceMovementId = row["source_movement_id"].as<std::string>();
    layer.batchId = optionalText(row["batch_id"]);
    layer.createdAt = Timestamp::fromEpochMillis(row["created_at_ms"].as<int64_t>());
    return layer;
}

domain::StockMovement toMovement(const pqxx::row& row) {
    domain::StockMovement movement;
    movement.id = row["id"].as<std::string>();
    movement.tenantId = row["tenant_id"].as<std::string>();
    movement.productId = row["product_id"].as<std::string>();
    movement.locationId = row["location_id"].as<std::string>();
    movement.movementType = domain::parseMovementType(row["movement_type"].as<std::string>());
    movement.quantity = row["quantity"].as<int64_t>();
    movement.unitCost = Money::fromString(row["unit_cost"].as<std::string>());
    movement.totalCost = Money::fromString(row["total_cost"].as<std::string>());
    movement.referenceType = domain::parseReferenceType(row["reference_type"].as<std::string>());
    movement.referenceId = optionalText(row["reference_id"]);
    movement.note = optionalText(row["note"]);
    auto method = optionalText(row["costing_method"]);
    if (method) {
        movement.costingMethod = domain::parsePricingMethod(*method);
    }
    movement.transferId = optionalText(row["transfer_id"]);
    movement.createdById = row["created_by_id"].as<std::string>();
    movement.createdAt = Timestamp::fromEpochMillis(row["created_at_ms"].as<int64_t>());
    return movement;
}

domain::StockReservation toReservation(const pqxx::row& row) {
    domain::StockReservation reservation;
    reservation.id = row["id"].as<std::string>();
    reservation.tenantId = row["tenant_id"].as<std::string>();
    reservation.productId = row["product_id"].as<std::string>();
    reservation.locationId = row["location_id"].as<std::string>();
    reservation.quantity = row["quantity"].as<int64_t>();
    reservation.expiresAt = Timestamp::fromEpochMillis(row["expires_at_ms"].as<int64_t>());
    reservation.status = domain::parseReservationStatus(row["status"].as<std::string>());
    reservation.referenceType = optionalText(row["reference_type"]);
    reservation.referenceId = optionalText(row["reference_id"]);
    reservation.createdById = row["created_by_id"].as<std::string>();
    reservation.createdAt = Timestamp::fromEpochMillis(row["created_at_ms"].as<int64_t>());
    return reservation;
}

} // namespace

// ============================================
// Catalog
// ============================================

std::vector<domain::Product> PostgresCatalogRepository::findProducts(
    const std::string& tenantId, const std::vector<std::string>& productIds)
{
    if (productIds.empty()) {
        return {};
    }
    return withPgErrors("findProducts", [&] {
        auto result = txn_.exec_params(
            "SELECT id, tenant_id, name, sku, product_type, pricing_method, reorder_level FROM products "
            "WHERE tenant_id = $1 AND deleted_at IS NULL AND id IN (" + quotedList(txn_, productIds) + ")",
            tenantId);

        std::vector<domain::Product> products;
        for (const auto& row : result) {
            domain::Product product;
            product.id = row["id"].as<std::string>();
            product.tenantId = row["tenant_id"].as<std::string>();
            product.name = row["name"].as<std::string>();
            product.sku = row["sku"].as<std::string>();
            product.productType = domain::parseProductType(row["product_type"].as<std::string>());
            auto method = optionalText(row["pricing_method"]);
            if (method) {
                product.pricingMethod = domain::parsePricingMethod(*method);
            }
            product.reorderLevel = row["reorder_level"].as<int64_t>();
            products.push_back(product);
        }
        return products;
    });
}

std::optional<domain::Product> PostgresCatalogRepository::findProduct(
    const std::string& tenantId, const std::string& productId)
{
    auto products = findProducts(tenantId, {productId});
    if (products.empty()) {
        return std::nullopt;
    }
    return products.front();
}

std::vector<domain::Location> PostgresCatalogRepository::findLocations(
    const std::string& tenantId, const std::vector<std::string>& locationIds)
{
    if (locationIds.empty()) {
        return {};
    }
    return withPgErrors("findLocations", [&] {
        auto result = txn_.exec_params(
            "SELECT id, tenant_id, name, code, is_active FROM locations "
            "WHERE tenant_id = $1 AND id IN (" + quotedList(txn_, locationIds) + ")",
            tenantId);

        std::vector<domain::Location> locations;
        for (const auto& row : result) {
            domain::Location location;
            location.id = row["id"].as<std::string>();
            location.tenantId = row["tenant_id"].as<std::string>();
            location.name = row["name"].as<std::string>();
            location.code = optionalText(row["code"]);
            location.active = row["is_active"].as<bool>();
            locations.push_back(location);
        }
        return locations;
    });
}

std::optional<domain::PricingMethod> PostgresCatalogRepository::findTenantPricingMethod(const std::string& tenantId) {
    return withPgErrors("findTenantPricingMethod", [&]() -> std::optional<domain::PricingMethod> {
        auto result = txn_.exec_params(
            "SELECT default_pricing_method FROM tenants WHERE id = $1", tenantId);
        if (result.empty() || result[0][0].is_null()) {
            return std::nullopt;
        }
        return domain::parsePricingMethod(result[0][0].as<std::string>());
    });
}

// ============================================
// Balances
// ============================================

std::optional<domain::Balance> PostgresBalanceRepository::find(
    const std::string& tenantId, const std::string& productId, const std::string& locationId)
{
    return withPgErrors("findBalance", [&]() -> std::optional<domain::Balance> {
        auto result = txn_.exec_params(
            "SELECT tenant_id, product_id, location_id, on_hand_quantity, reserved_quantity "
            "FROM inventory_balances WHERE tenant_id = $1 AND product_id = $2 AND location_id = $3",
            tenantId, productId, locationId);
        if (result.empty()) {
            return std::nullopt;
        }
        return toBalance(result[0]);
    });
}

std::vector<domain::Balance> PostgresBalanceRepository::lockForUpdate(
    const std::string& tenantId, const std::string& locationId,
    const std::vector<std::string>& productIds)
{
    if (productIds.empty()) {
        return {};
    }
    return withPgErrors("lockBalances", [&] {
        // Одинаковый порядок блокировок во всех транзакциях исключает deadlock
        auto result = txn_.exec_params(
            "SELECT tenant_id, product_id, location_id, on_hand_quantity, reserved_quantity "
            "FROM inventory_balances WHERE tenant_id = $1 AND location_id = $2 "
            "AND product_id IN (" + quotedList(txn_, productIds) + ") "
            "ORDER BY product_id FOR UPDATE",
            tenantId, locationId);

        std::vector<domain::Balance> balances;
        for (const auto& row : result) {
            balances.push_back(toBalance(row));
        }
        return balances;
    });
}

void PostgresBalanceRepository::incrementOnHand(
    const std::string& tenantId, const std::string& productId,
    const std::string& locationId, int64_t delta)
{
    withPgErrors("incrementOnHand", [&] {
        txn_.exec_params(
            "INSERT INTO inventory_balances "
            "(tenant_id, product_id, location_id, on_hand_quantity, reserved_quantity, updated_at) "
            "VALUES ($1, $2, $3, GREATEST($4::bigint, 0), 0, NOW()) "
            "ON CONFLICT (tenant_id, product_id, location_id) DO UPDATE SET "
            "on_hand_quantity = inventory_balances.on_hand_quantity + $4::bigint, "
            "updated_at = NOW()",
            tenantId, productId, locationId, delta);
    });
}

void PostgresBalanceRepository::incrementReserved(
    const std::string& tenantId, const std::string& productId,
    const std::string& locationId, int64_t delta)
{
    withPgErrors("incrementReserved", [&] {
        txn_.exec_params(
            "INSERT INTO inventory_balances "
            "(tenant_id, product_id, location_id, on_hand_quantity, reserved_quantity, updated_at) "
            "VALUES ($1, $2, $3, 0, GREATEST($4::bigint, 0), NOW()) "
            "ON CONFLICT (tenant_id, product_id, location_id) DO UPDATE SET "
            "reserved_quantity = inventory_balances.reserved_quantity + $4::bigint, "
            "updated_at = NOW()",
            tenantId, productId, locationId, delta);
    });
}

std::vector<domain::Balance> PostgresBalanceRepository::findByProduct(
    const std::string& tenantId, const std::string& productId)
{
    return withPgErrors("findBalancesByProduct", [&] {
        auto result = txn_.exec_params(
            "SELECT tenant_id, product_id, location_id, on_hand_quantity, reserved_quantity "
            "FROM inventory_balances WHERE tenant_id = $1 AND product_id = $2 ORDER BY location_id",
            tenantId, productId);
        std::vector<domain::Balance> balances;
        for (const auto& row : result) {
            balances.push_back(toBalance(row));
        }
        return balances;
    });
}

std::vector<domain::Balance> PostgresBalanceRepository::findByLocation(
    const std::string& tenantId, const std::string& locationId)
{
    return withPgErrors("findBalancesByLocation", [&] {
        auto result = txn_.exec_params(
            "SELECT tenant_id, product_id, location_id, on_hand_quantity, reserved_quantity "
            "FROM inventory_balances WHERE tenant_id = $1 AND location_id = $2 ORDER BY product_id",
            tenantId, locationId);
        std::vector<domain::Balance> balances;
        for (const auto& row : result) {
            balances.push_back(toBalance(row));
        }
        return balances;
    });
}

std::vector<domain::LowStockLine> PostgresBalanceRepository::findBelowReorderLevel(
    const std::string& tenantId, const std::optional<std::string>& locationId)
{
    return withPgErrors("findBelowReorderLevel", [&] {
        auto result = txn_.exec_params(
            "SELECT ib.product_id, p.name AS product_name, p.sku AS product_sku, "
            "ib.location_id, l.name AS location_name, ib.on_hand_quantity, p.reorder_level, "
            "(p.reorder_level - ib.on_hand_quantity) AS shortage "
            "FROM inventory_balances ib "
            "JOIN products p ON p.id = ib.product_id "
            "JOIN locations l ON l.id = ib.location_id "
            "WHERE ib.tenant_id = $1 AND p.reorder_level > 0 AND p.deleted_at IS NULL "
            "AND ib.on_hand_quantity < p.reorder_level "
            "AND ($2::text IS NULL OR ib.location_id = $2::text) "
            "ORDER BY shortage DESC, ib.product_id, ib.location_id",
            tenantId, locationId);

        std::vector<domain::LowStockLine> lines;
        for (const auto& row : result) {
            domain::LowStockLine line;
            line.productId = row["product_id"].as<std::string>();
            line.productName = row["product_name"].as<std::string>();
            line.productSku = row["product_sku"].as<std::string>();
            line.locationId = row["location_id"].as<std::string>();
            line.locationName = row["location_name"].as<std::string>();
            line.onHandQuantity = row["on_hand_quantity"].as<int64_t>();
            line.reorderLevel = row["reorder_level"].as<int64_t>();
            line.shortage = row["shortage"].as<int64_t>();
            lines.push_back(line);
        }
        return lines;
    });
}

// ============================================
// Valuation layers
// ============================================

void PostgresValuationLayerRepository::insert(const domain::ValuationLayer& layer) {
    withPgErrors("insertLayer", [&] {
        txn_.exec_params(
            "INSERT INTO valuation_layers (id, tenant_id, product_id, location_id, original_qty, remaining_qty, "
            "unit_cost, source_movement_id, batch_id, created_at) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7::numeric, $8, $9, to_timestamp($10::bigint / 1000.0))",
            layer.id, layer.tenantId, layer.productId, layer.locationId,
            layer.originalQty, layer.remainingQty, layer.unitCost.toString(),
            layer.sourceMovementId, layer.batchId, layer.createdAt.epochMillis());
    });
}

std::vector<domain::ValuationLayer> PostgresValuationLayerRepository::findOpenForUpdate(
    const std::string& tenantId, const std::string& productId,
    const std::string& locationId, ports::output::LayerOrder order)
{
    std::string direction = order == ports::output::LayerOrder::NEWEST_FIRST ? "DESC" : "ASC";
    return withPgErrors("findOpenLayers", [&] {
        auto result = txn_.exec_params(
            std::string("SELECT ") + LAYER_COLUMNS + " FROM valuation_layers "
            "WHERE tenant_id = $1 AND product_id = $2 AND location_id = $3 AND remaining_qty > 0 "
            "ORDER BY created_at " + direction + ", seq " + direction + " FOR UPDATE",
            tenantId, productId, locationId);
        std::vector<domain::ValuationLayer> layers;
        for (const auto& row : result) {
            layers.push_back(toLayer(row));
        }
        return layers;
    });
}

std::vector<domain::ValuationLayer> PostgresValuationLayerRepository::findAll(
    const std::string& tenantId, const std::string& productId, const std::string& locationId)
{
    return withPgErrors("findLayers", [&] {
        auto result = txn_.exec_params(
            std::string("SELECT ") + LAYER_COLUMNS + " FROM valuation_layers "
            "WHERE tenant_id = $1 AND product_id = $2 AND location_id = $3 "
            "ORDER BY created_at, seq",
            tenantId, productId, locationId);
        std::vector<domain::ValuationLayer> layers;
        for (const auto& row : result) {
            layers.push_back(toLayer(row));
        }
        return layers;
    });
}

std::vector<domain::ValuationLayer> PostgresValuationLayerRepository::findOpenByTenant(const std::string& tenantId) {
    return withPgErrors("findOpenLayersByTenant", [&] {
        auto result = txn_.exec_params(
            std::string("SELECT ") + LAYER_COLUMNS + " FROM valuation_layers "
            "WHERE tenant_id = $1 AND remaining_qty > 0 ORDER BY created_at, seq",
            tenantId);
        std::vector<domain::ValuationLayer> layers;
        for (const auto& row : result) {
            layers.push_back(toLayer(row));
        }
        return layers;
    });
}

int64_t PostgresValuationLayerRepository::sumRemaining(
    const std::string& tenantId, const std::string& productId, const std::string& locationId)
{
    return withPgErrors("sumRemaining", [&] {
        auto result = txn_.exec_params(
            "SELECT COALESCE(SUM(remaining_qty), 0)::bigint FROM valuation_layers "
            "WHERE tenant_id = $1 AND product_id = $2 AND location_id = $3",
            tenantId, productId, locationId);
        return result[0][0].as<int64_t>();
    });
}

void PostgresValuationLayerRepository::decrementRemaining(const std::string& layerId, int64_t quantity) {
    withPgErrors("decrementRemaining", [&] {
        txn_.exec_params(
            "UPDATE valuation_layers SET remaining_qty = remaining_qty - $2 WHERE id = $1",
            layerId, quantity);
    });
}

void PostgresValuationLayerRepository::insertConsumptions(
    const std::vector<domain::ValuationLayerConsumption>& consumptions)
{
    withPgErrors("insertConsumptions", [&] {
        for (const auto& c : consumptions) {
            txn_.exec_params(
                "INSERT INTO valuation_layer_consumptions "
                "(valuation_layer_id, stock_movement_id, quantity, unit_cost) VALUES ($1, $2, $3, $4::numeric)",
                c.valuationLayerId, c.stockMovementId, c.quantity, c.unitCost.toString());
        }
    });
}

std::vector<domain::ValuationLayerConsumption> PostgresValuationLayerRepository::findConsumptionsByMovement(
    const std::string& movementId)
{
    return withPgErrors("findConsumptions", [&] {
        auto result = txn_.exec_params(
            "SELECT valuation_layer_id, stock_movement_id, quantity, unit_cost::text AS unit_cost "
            "FROM valuation_layer_consumptions WHERE stock_movement_id = $1 ORDER BY id",
            movementId);
        std::vector<domain::ValuationLayerConsumption> consumptions;
        for (const auto& row : result) {
            domain::ValuationLayerConsumption c;
            c.valuationLayerId = row["valuation_layer_id"].as<std::string>();
            c.stockMovementId = row["stock_movement_id"].as<std::string>();
            c.quantity = row["quantity"].as<int64_t>();
            c.unitCost = Money::fromString(row["unit_cost"].as<std::string>());
            consumptions.push_back(c);
        }
        return consumptions;
    });
}

// ============================================
// Movements
// ============================================

void PostgresStockMovementRepository::insert(const domain::StockMovement& m) {
    std::optional<std::string> costingMethod;
    if (m.costingMethod) {
        costingMethod = domain::toString(*m.costingMethod);
    }
    withPgErrors("insertMovement", [&] {
        txn_.exec_params(
            "INSERT INTO stock_movements (id, tenant_id, product_id, location_id, movement_type, quantity, "
            "unit_cost, total_cost, reference_type, reference_id, note, costing_method, transfer_id, "
            "created_by_id, created_at) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7::numeric, $8::numeric, $9, $10, $11, $12, $13, $14, "
            "to_timestamp($15::bigint / 1000.0))",
            m.id, m.tenantId, m.productId, m.locationId, domain::toString(m.movementType), m.quantity,
            m.unitCost.toString(), m.totalCost.toString(), domain::toString(m.referenceType),
            m.referenceId, m.note, costingMethod, m.transferId, m.createdById, m.createdAt.epochMillis());
    });
}

std::optional<domain::StockMovement> PostgresStockMovementRepository::findById(
    const std::string& tenantId, const std::string& movementId)
{
    return withPgErrors("findMovement", [&]() -> std::optional<domain::StockMovement> {
        auto result = txn_.exec_params(
            std::string("SELECT ") + MOVEMENT_COLUMNS + " FROM stock_movements WHERE tenant_id = $1 AND id = $2",
            tenantId, movementId);
        if (result.empty()) {
            return std::nullopt;
        }
        return toMovement(result[0]);
    });
}

std::vector<domain::StockMovement> PostgresStockMovementRepository::findByTransfer(
    const std::string& tenantId, const std::string& transferId)
{
    return withPgErrors("findMovementsByTransfer", [&] {
        auto result = txn_.exec_params(
            std::string("SELECT ") + MOVEMENT_COLUMNS + " FROM stock_movements "
            "WHERE tenant_id = $1 AND transfer_id = $2 ORDER BY created_at",
            tenantId, transferId);
        std::vector<domain::StockMovement> movements;
        for (const auto& row : result) {
            movements.push_back(toMovement(row));
        }
        return movements;
    });
}

// ============================================
// Transfers
// ============================================

int64_t PostgresStockTransferRepository::nextSequence(const std::string& tenantId, int year) {
    return withPgErrors("nextTransferSequence", [&] {
        auto result = txn_.exec_params(
            "INSERT INTO transfer_sequences (tenant_id, year, last_value) VALUES ($1, $2, 1) "
            "ON CONFLICT (tenant_id, year) DO UPDATE SET last_value = transfer_sequences.last_value + 1 "
            "RETURNING last_value",
            tenantId, year);
        return result[0][0].as<int64_t>();
    });
}

void PostgresStockTransferRepository::insert(const domain::StockTransfer& t) {
    withPgErrors("insertTransfer", [&] {
        txn_.exec_params(
            "INSERT INTO stock_transfers (id, tenant_id, transfer_number, status, from_location_id, "
            "to_location_id, note, created_by_id, created_at, shipped_at, received_at, cancelled_at) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, to_timestamp($9::bigint / 1000.0), "
            "to_timestamp($10::bigint / 1000.0), to_timestamp($11::bigint / 1000.0), "
            "to_timestamp($12::bigint / 1000.0))",
            t.id, t.tenantId, t.transferNumber, domain::toString(t.status), t.fromLocationId,
            t.toLocationId, t.note, t.createdById, t.createdAt.epochMillis(),
            millisParam(t.shippedAt), millisParam(t.receivedAt), millisParam(t.cancelledAt));

        int position = 0;
        for (const auto& item : t.items) {
            txn_.exec_params(
                "INSERT INTO stock_transfer_items (id, transfer_id, position, product_id, requested_quantity, "
                "shipped_quantity, shipped_unit_cost, received_quantity, shortage_reason) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7::numeric, $8, $9)",
                item.id, t.id, position++, item.productId, item.requestedQuantity,
                item.shippedQuantity, moneyParam(item.shippedUnitCost), item.receivedQuantity,
                item.shortageReason);
        }
    });
}

std::optional<domain::StockTransfer> PostgresStockTransferRepository::findById(
    const std::string& tenantId, const std::string& transferId)
{
    return load(tenantId, transferId, false);
}

std::optional<domain::StockTransfer> PostgresStockTransferRepository::findForUpdate(
    const std::string& tenantId, const std::string& transferId)
{
    return load(tenantId, transferId, true);
}

std::optional<domain::StockTransfer> PostgresStockTransferRepository::load(
    const std::string& tenantId, const std::string& transferId, bool forUpdate)
{
    return withPgErrors("loadTransfer", [&]() -> std::optional<domain::StockTransfer> {
        auto result = txn_.exec_params(
            std::string(
                "SELECT id, tenant_id, transfer_number, status, from_location_id, to_location_id, note, "
                "created_by_id, (EXTRACT(EPOCH FROM created_at) * 1000)::bigint AS created_at_ms, "
                "(EXTRACT(EPOCH FROM shipped_at) * 1000)::bigint AS shipped_at_ms, "
                "(EXTRACT(EPOCH FROM received_at) * 1000)::bigint AS received_at_ms, "
                "(EXTRACT(EPOCH FROM cancelled_at) * 1000)::bigint AS cancelled_at_ms "
                "FROM stock_transfers WHERE tenant_id = $1 AND id = $2") +
                (forUpdate ? " FOR UPDATE" : ""),
            tenantId, transferId);
        if (result.empty()) {
            return std::nullopt;
        }

        const auto& row = result[0];
        domain::StockTransfer transfer;
        transfer.id = row["id"].as<std::string>();
        transfer.tenantId = row["tenant_id"].as<std::string>();
        transfer.transferNumber = row["transfer_number"].as<std::string>();
        transfer.status = domain::parseTransferStatus(row["status"].as<std::string>());
        transfer.fromLocationId = row["from_location_id"].as<std::string>();
        transfer.toLocationId = row["to_location_id"].as<std::string>();
        transfer.note = optionalText(row["note"]);
        transfer.createdById = row["created_by_id"].as<std::string>();
        transfer.createdAt = Timestamp::fromEpochMillis(row["created_at_ms"].as<int64_t>());
        transfer.shippedAt = optionalTime(row["shipped_at_ms"]);
        transfer.receivedAt = optionalTime(row["received_at_ms"]);
        transfer.cancelledAt = optionalTime(row["cancelled_at_ms"]);

        auto items = txn_.exec_params(
            "SELECT id, product_id, requested_quantity, shipped_quantity, "
            "shipped_unit_cost::text AS shipped_unit_cost, received_quantity, shortage_reason "
            "FROM stock_transfer_items WHERE transfer_id = $1 ORDER BY position",
            transferId);
        for (const auto& itemRow : items) {
            domain::TransferItem item;
            item.id = itemRow["id"].as<std::string>();
            item.productId = itemRow["product_id"].as<std::string>();
            item.requestedQuantity = itemRow["requested_quantity"].as<int64_t>();
            item.shippedQuantity = itemRow["shipped_quantity"].as<int64_t>();
            auto cost = optionalText(itemRow["shipped_unit_cost"]);
            if (cost) {
                item.shippedUnitCost = Money::fromString(*cost);
            }
            item.receivedQuantity = itemRow["received_quantity"].as<int64_t>();
            item.shortageReason = optionalText(itemRow["shortage_reason"]);
            transfer.items.push_back(item);
        }
        return transfer;
    });
}

void PostgresStockTransferRepository::update(const domain::StockTransfer& t) {
    withPgErrors("updateTransfer", [&] {
        txn_.exec_params(
            "UPDATE stock_transfers SET status = $3, note = $4, "
            "shipped_at = to_timestamp($5::bigint / 1000.0), "
            "received_at = to_timestamp($6::bigint / 1000.0), "
            "cancelled_at = to_timestamp($7::bigint / 1000.0) "
            "WHERE tenant_id = $1 AND id = $2",
            t.tenantId, t.id, domain::toString(t.status), t.note,
            millisParam(t.shippedAt), millisParam(t.receivedAt), millisParam(t.cancelledAt));

        for (const auto& item : t.items) {
            txn_.exec_params(
                "UPDATE stock_transfer_items SET shipped_quantity = $2, shipped_unit_cost = $3::numeric, "
                "received_quantity = $4, shortage_reason = $5 WHERE id = $1",
                item.id, item.shippedQuantity, moneyParam(item.shippedUnitCost),
                item.receivedQuantity, item.shortageReason);
        }
    });
}

// ============================================
// Reservations
// ============================================

void PostgresStockReservationRepository::insert(const domain::StockReservation& r) {
    withPgErrors("insertReservation", [&] {
        txn_.exec_params(
            "INSERT INTO stock_reservations (id, tenant_id, product_id, location_id, quantity, expires_at, "
            "status, reference_type, reference_id, created_by_id, created_at) "
            "VALUES ($1, $2, $3, $4, $5, to_timestamp($6::bigint / 1000.0), $7, $8, $9, $10, "
            "to_timestamp($11::bigint / 1000.0))",
            r.id, r.tenantId, r.productId, r.locationId, r.quantity, r.expiresAt.epochMillis(),
            domain::toString(r.status), r.referenceType, r.referenceId, r.createdById,
            r.createdAt.epochMillis());
    });
}

std::optional<domain::StockReservation> PostgresStockReservationRepository::findById(
    const std::string& tenantId, const std::string& reservationId)
{
    return load(tenantId, reservationId, false);
}

std::optional<domain::StockReservation> PostgresStockReservationRepository::findForUpdate(
    const std::string& tenantId, const std::string& reservationId)
{
    return load(tenantId, reservationId, true);
}

std::optional<domain::StockReservation> PostgresStockReservationRepository::load(
    const std::string& tenantId, const std::string& reservationId, bool forUpdate)
{
    return withPgErrors("loadReservation", [&]() -> std::optional<domain::StockReservation> {
        auto result = txn_.exec_params(
            std::string("SELECT ") + RESERVATION_COLUMNS +
                " FROM stock_reservations WHERE tenant_id = $1 AND id = $2" +
                (forUpdate ? " FOR UPDATE" : ""),
            tenantId, reservationId);
        if (result.empty()) {
            return std::nullopt;
        }
        return toReservation(result[0]);
    });
}

void PostgresStockReservationRepository::update(const domain::StockReservation& r) {
    withPgErrors("updateReservation", [&] {
        txn_.exec_params(
            "UPDATE stock_reservations SET quantity = $3, expires_at = to_timestamp($4::bigint / 1000.0), "
            "status = $5, reference_type = $6, reference_id = $7 WHERE tenant_id = $1 AND id = $2",
            r.tenantId, r.id, r.quantity, r.expiresAt.epochMillis(), domain::toString(r.status),
            r.referenceType, r.referenceId);
    });
}

std::vector<domain::StockReservation> PostgresStockReservationRepository::findAllActive() {
    return withPgErrors("findActiveReservations", [&] {
        auto result = txn_.exec(
            std::string("SELECT ") + RESERVATION_COLUMNS +
            " FROM stock_reservations WHERE status = 'ACTIVE' ORDER BY expires_at");
        std::vector<domain::StockReservation> reservations;
        for (const auto& row : result) {
            reservations.push_back(toReservation(row));
        }
        return reservations;
    });
}

} // namespace inventory::adapters::secondary
