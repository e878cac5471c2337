#pragma once

#include "domain/StockTransfer.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace inventory::ports::output {

class IStockTransferRepository {
public:
    virtual ~IStockTransferRepository() = default;

    /**
     * @brief Следующий номер в последовательности тенанта за год
     *
     * Атомарный счётчик: параллельные вызовы получают разные значения.
     */
    virtual int64_t nextSequence(const std::string& tenantId, int year) = 0;

    virtual void insert(const domain::StockTransfer& transfer) = 0;

    virtual std::optional<domain::StockTransfer> findById(
        const std::string& tenantId, const std::string& transferId) = 0;

    /// То же, что findById, но со строковой блокировкой перемещения
    virtual std::optional<domain::StockTransfer> findForUpdate(
        const std::string& tenantId, const std::string& transferId) = 0;

    /// Сохраняет статус, даты, заметку и поля строк
    virtual void update(const domain::StockTransfer& transfer) = 0;
};

} // namespace inventory::ports::output
