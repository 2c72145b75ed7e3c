#pragma once

#include "transaction/itransaction.hpp"

#include <memory>

namespace sqlmemo {

/**
 * @brief Transaction managed with explicit BEGIN / COMMIT / ROLLBACK
 *
 * The connection is opened on first use. Unless autocommit is set, a
 * BEGIN is issued before the first statement of every unit of work;
 * commit() / rollback() end it. close() rolls back an open unit of work
 * and releases the connection.
 */
class ConnectionTransaction : public ITransaction {
public:
    ConnectionTransaction(std::shared_ptr<IDataSource> data_source, bool autocommit);
    ~ConnectionTransaction() override;

    ConnectionTransaction(const ConnectionTransaction&) = delete;
    ConnectionTransaction& operator=(const ConnectionTransaction&) = delete;

    [[nodiscard]] IDbConnection& connection() override;
    void commit() override;
    void rollback() override;
    void close() override;

    [[nodiscard]] bool in_transaction() const { return in_transaction_; }

private:
    void run(const char* command);

    std::shared_ptr<IDataSource> data_source_;
    std::unique_ptr<IDbConnection> connection_;
    bool autocommit_;
    bool in_transaction_ = false;
};

class ConnectionTransactionFactory : public ITransactionFactory {
public:
    [[nodiscard]] std::unique_ptr<ITransaction> new_transaction(
        std::shared_ptr<IDataSource> data_source, bool autocommit) override;
};

} // namespace sqlmemo
