#include "transaction/connection_transaction.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlmemo {

ConnectionTransaction::ConnectionTransaction(std::shared_ptr<IDataSource> data_source, bool autocommit)
    : data_source_(std::move(data_source)),
      autocommit_(autocommit) {}

ConnectionTransaction::~ConnectionTransaction() {
    try {
        close();
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Transaction: close failed during destruction: {}", e.what()));
    }
}

IDbConnection& ConnectionTransaction::connection() {
    if (!connection_) {
        if (!data_source_) {
            throw DataAccessError("Transaction has no data source");
        }
        connection_ = data_source_->get_connection();
        if (!connection_) {
            throw DataAccessError(std::format("Could not open connection to {}", data_source_->describe()));
        }
    }
    if (!autocommit_ && !in_transaction_) {
        run("BEGIN");
        in_transaction_ = true;
    }
    return *connection_;
}

void ConnectionTransaction::commit() {
    if (!connection_ || !in_transaction_) return;
    in_transaction_ = false;
    run("COMMIT");
}

void ConnectionTransaction::rollback() {
    if (!connection_ || !in_transaction_) return;
    in_transaction_ = false;
    run("ROLLBACK");
}

void ConnectionTransaction::close() {
    if (!connection_) return;
    // Release the connection whatever happens to the rollback
    auto conn = std::move(connection_);
    const bool open_work = in_transaction_;
    in_transaction_ = false;
    if (open_work) {
        const auto result = conn->execute("ROLLBACK", {});
        if (!result.success) {
            conn->close();
            throw DataAccessError(std::format("ROLLBACK on close failed: {}", result.error_message));
        }
    }
    conn->close();
}

void ConnectionTransaction::run(const char* command) {
    const auto result = connection_->execute(command, {});
    if (!result.success) {
        throw DataAccessError(std::format("{} failed: {}", command, result.error_message));
    }
}

std::unique_ptr<ITransaction> ConnectionTransactionFactory::new_transaction(
    std::shared_ptr<IDataSource> data_source, bool autocommit) {
    return std::make_unique<ConnectionTransaction>(std::move(data_source), autocommit);
}

} // namespace sqlmemo
