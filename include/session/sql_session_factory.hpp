#pragma once

#include "config/configuration.hpp"
#include "session/sql_session.hpp"
#include "transaction/itransaction.hpp"

#include <memory>

namespace sqlmemo {

/**
 * @brief Opens sessions over a shared configuration
 */
class SqlSessionFactory {
public:
    explicit SqlSessionFactory(std::shared_ptr<Configuration> configuration);

    /**
     * @brief Open a session with a transaction from the environment
     * @throws ExecutorError(MISCONFIGURED_ENVIRONMENT) without an
     *         environment, data source or transaction factory
     */
    [[nodiscard]] std::unique_ptr<SqlSession> open_session();
    [[nodiscard]] std::unique_ptr<SqlSession> open_session(bool autocommit);

    /// Open a session over a caller-supplied transaction
    [[nodiscard]] std::unique_ptr<SqlSession> open_session(std::unique_ptr<ITransaction> transaction,
                                                           bool autocommit = false);

    [[nodiscard]] const std::shared_ptr<Configuration>& configuration() const { return configuration_; }

private:
    std::shared_ptr<Configuration> configuration_;
};

} // namespace sqlmemo
