#include <catch2/catch_test_macros.hpp>
#include "config/configuration.hpp"
#include "core/error.hpp"
#include "core/mapped_object.hpp"
#include "executor/executor.hpp"
#include "executor/simple_statement_backend.hpp"
#include "mocks/mock_database.hpp"
#include "mocks/mock_transaction.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace sqlmemo;
using namespace sqlmemo::testing;

namespace {

const std::string kAllPosts = "SELECT id, author_id FROM posts";
const std::string kFindAuthor = "SELECT id, name FROM authors WHERE id = $1";
const std::string kFindEmployee = "SELECT id, manager_id FROM employees WHERE id = $1";
const std::string kTotalPosts = "SELECT total FROM count_posts($1)";
const std::string kRenameAuthor = "UPDATE authors SET name = $1 WHERE id = $2";

struct BackendFixture {
    std::shared_ptr<MockDatabase> db = std::make_shared<MockDatabase>();
    std::shared_ptr<Configuration> config = std::make_shared<Configuration>();
    std::shared_ptr<Executor> executor;

    BackendFixture() {
        config->set_statement_backend(std::make_shared<SimpleStatementBackend>());
        config->set_environment(Environment{"test", nullptr, nullptr});

        MappedStatement posts;
        posts.id = "PostMapper.all";
        posts.result_type = "Post";
        posts.sql_source = std::make_shared<StaticSqlSource>(kAllPosts);
        posts.nested_selects.push_back({"author", "AuthorMapper.find", "author_id", TargetType::OBJECT, false});
        config->add_statement(posts);

        MappedStatement author;
        author.id = "AuthorMapper.find";
        author.result_type = "Author";
        author.sql_source = std::make_shared<StaticSqlSource>(kFindAuthor, std::vector<ParameterMapping>{{"id"}});
        config->add_statement(author);

        MappedStatement employee;
        employee.id = "EmployeeMapper.find";
        employee.result_type = "Employee";
        employee.sql_source = std::make_shared<StaticSqlSource>(kFindEmployee, std::vector<ParameterMapping>{{"id"}});
        employee.nested_selects.push_back({"manager", "EmployeeMapper.find", "manager_id", TargetType::OBJECT, false});
        config->add_statement(employee);

        MappedStatement total;
        total.id = "PostMapper.total";
        total.statement_type = StatementType::CALLABLE;
        total.sql_source = std::make_shared<StaticSqlSource>(kTotalPosts, std::vector<ParameterMapping>{
            {"author_id", ParameterMode::IN}, {"total", ParameterMode::OUT}});
        config->add_statement(total);

        MappedStatement rename;
        rename.id = "AuthorMapper.rename";
        rename.command_type = CommandType::UPDATE;
        rename.sql_source = std::make_shared<StaticSqlSource>(kRenameAuthor, std::vector<ParameterMapping>{
            {"name"}, {"id"}});
        config->add_statement(rename);

        executor = Executor::create(config, std::make_unique<MockTransaction>(
            std::make_shared<TransactionProbe>(), db));
    }

    ResultListPtr select(const std::string& id, const Value& parameter, const RowBounds& bounds = {}) {
        return executor->query(*config->statement(id), parameter, bounds);
    }
};

std::string text(const ObjectPtr& obj, const std::string& property) {
    return std::get<std::string>(obj->get_value(property));
}

} // namespace

TEST_CASE("SimpleStatementBackend: maps columns to properties", "[simple_backend]") {
    BackendFixture f;
    f.db->set_handler([](const std::string&, const std::vector<Value>& params) {
        const auto id = std::get<std::string>(params.at(0));
        return MockDatabase::rows({"id", "name"}, {{id, std::nullopt}});
    });

    const auto list = f.select("AuthorMapper.find", std::string("7"));
    REQUIRE(list->size() == 1);
    const auto& author = list->front();
    CHECK(author->type_name() == "Author");
    CHECK(text(author, "id") == "7");
    CHECK(author->has("name"));
    CHECK(is_null(author->get_value("name")));

    const auto executed = f.db->executed();
    REQUIRE(executed.size() == 1);
    CHECK(executed[0].sql == kFindAuthor);
    CHECK(std::get<std::string>(executed[0].params.at(0)) == "7");
}

TEST_CASE("SimpleStatementBackend: nested select runs once per distinct fingerprint", "[simple_backend][nested]") {
    BackendFixture f;
    f.db->set_handler([](const std::string& sql, const std::vector<Value>& params) {
        if (sql == kAllPosts) {
            return MockDatabase::rows({"id", "author_id"}, {{"1", "10"}, {"2", "20"}, {"3", "10"}});
        }
        const auto id = std::get<std::string>(params.at(0));
        return MockDatabase::rows({"id", "name"}, {{id, "author-" + id}});
    });

    const auto posts = f.select("PostMapper.all", Value{});
    REQUIRE(posts->size() == 3);

    CHECK(f.db->count(kAllPosts) == 1);
    CHECK(f.db->count(kFindAuthor) == 2);

    const auto a1 = std::get<ObjectPtr>((*posts)[0]->get_value("author"));
    const auto a2 = std::get<ObjectPtr>((*posts)[1]->get_value("author"));
    const auto a3 = std::get<ObjectPtr>((*posts)[2]->get_value("author"));
    CHECK(text(a1, "name") == "author-10");
    CHECK(text(a2, "name") == "author-20");
    // Rows sharing a fingerprint share the resolved object
    CHECK(a1 == a3);
    CHECK(f.executor->pending_deferred_loads() == 0);
}

TEST_CASE("SimpleStatementBackend: row bounds skip and limit in memory", "[simple_backend]") {
    BackendFixture f;
    f.db->set_handler([](const std::string& sql, const std::vector<Value>& params) {
        if (sql == kAllPosts) {
            return MockDatabase::rows({"id", "author_id"}, {{"1", "10"}, {"2", "20"}, {"3", "30"}});
        }
        const auto id = std::get<std::string>(params.at(0));
        return MockDatabase::rows({"id", "name"}, {{id, "author-" + id}});
    });

    const auto page = f.select("PostMapper.all", Value{}, RowBounds{1, 1});
    REQUIRE(page->size() == 1);
    CHECK(text(page->front(), "id") == "2");
    CHECK(f.db->count(kFindAuthor) == 1);

    const auto past_end = f.select("PostMapper.all", Value{}, RowBounds{5, 10});
    CHECK(past_end->empty());
}

TEST_CASE("SimpleStatementBackend: null association column leaves the property unset", "[simple_backend][nested]") {
    BackendFixture f;
    f.db->set_handler([](const std::string& sql, const std::vector<Value>&) {
        if (sql == kAllPosts) {
            return MockDatabase::rows({"id", "author_id"}, {{"1", std::nullopt}});
        }
        return MockDatabase::rows({"id", "name"}, {});
    });

    const auto posts = f.select("PostMapper.all", Value{});
    REQUIRE(posts->size() == 1);
    CHECK_FALSE(posts->front()->has("author"));
    CHECK(f.db->count(kFindAuthor) == 0);
}

TEST_CASE("SimpleStatementBackend: self-referencing row terminates without recursion", "[simple_backend][cycle]") {
    BackendFixture f;
    f.db->set_handler([](const std::string&, const std::vector<Value>& params) {
        const auto id = std::get<std::string>(params.at(0));
        return MockDatabase::rows({"id", "manager_id"}, {{id, id}});
    });

    std::weak_ptr<MappedObject> watch;
    {
        const auto list = f.select("EmployeeMapper.find", std::string("1"));
        REQUIRE(list->size() == 1);
        const auto& boss = list->front();
        watch = boss;

        CHECK(f.db->count(kFindEmployee) == 1);
        CHECK(std::get<ObjectPtr>(boss->get_value("manager")) == boss);
        CHECK(boss->is_back_reference("manager"));
        CHECK(f.executor->local_cache().size() == 1);
    }

    // Released with its owners: the memo and the returned list
    CHECK_FALSE(watch.expired());
    f.executor->clear_local_cache();
    CHECK(watch.expired());
}

TEST_CASE("SimpleStatementBackend: two-row cycle resolves both sides", "[simple_backend][cycle]") {
    BackendFixture f;
    f.db->set_handler([](const std::string&, const std::vector<Value>& params) {
        const auto id = std::get<std::string>(params.at(0));
        return MockDatabase::rows({"id", "manager_id"}, {{id, id == "1" ? "2" : "1"}});
    });

    std::weak_ptr<MappedObject> watch_first;
    std::weak_ptr<MappedObject> watch_second;
    {
        const auto list = f.select("EmployeeMapper.find", std::string("1"));
        REQUIRE(list->size() == 1);
        const auto first = list->front();
        const auto second = std::get<ObjectPtr>(first->get_value("manager"));
        REQUIRE(second);
        watch_first = first;
        watch_second = second;

        CHECK(text(second, "id") == "2");
        CHECK(std::get<ObjectPtr>(second->get_value("manager")) == first);
        CHECK_FALSE(first->is_back_reference("manager"));
        CHECK(second->is_back_reference("manager"));
        CHECK(f.db->count(kFindEmployee) == 2);
        CHECK(f.executor->stats().deferred_loads_applied == 1);

        // A later lookup of either employee is served from the memo
        CHECK(f.select("EmployeeMapper.find", std::string("2"))->front() == second);
        CHECK(f.db->count(kFindEmployee) == 2);
    }

    f.executor->clear_local_cache();
    CHECK(watch_first.expired());
    CHECK(watch_second.expired());
}

TEST_CASE("SimpleStatementBackend: database failure becomes DataAccessError", "[simple_backend]") {
    BackendFixture f;
    f.db->set_handler([](const std::string&, const std::vector<Value>&) {
        return MockDatabase::failure("relation \"authors\" does not exist");
    });

    CHECK_THROWS_AS(f.select("AuthorMapper.find", std::string("7")), DataAccessError);
    CHECK(f.executor->local_cache().empty());
}

TEST_CASE("SimpleStatementBackend: result handler receives mapped rows", "[simple_backend]") {
    BackendFixture f;
    f.db->set_handler([](const std::string& sql, const std::vector<Value>& params) {
        if (sql == kAllPosts) {
            return MockDatabase::rows({"id", "author_id"}, {{"1", "10"}, {"2", "10"}});
        }
        const auto id = std::get<std::string>(params.at(0));
        return MockDatabase::rows({"id", "name"}, {{id, "author-" + id}});
    });

    struct Collector : IResultHandler {
        void handle_result(const ObjectPtr& row) override { rows.push_back(row); }
        std::vector<ObjectPtr> rows;
    } collector;

    const auto list = f.executor->query(*f.config->statement("PostMapper.all"), Value{}, RowBounds{}, &collector);
    CHECK(list->empty());
    REQUIRE(collector.rows.size() == 2);
    CHECK(collector.rows[0]->has("author"));
}

TEST_CASE("SimpleStatementBackend: CALLABLE copies OUT columns into the parameter", "[simple_backend][callable]") {
    BackendFixture f;
    f.db->set_handler([](const std::string&, const std::vector<Value>& params) {
        CHECK(params.size() == 1);
        return MockDatabase::rows({"total"}, {{"42"}});
    });

    auto param = MappedObject::create("Count");
    param->set_value("author_id", std::string("10"));
    (void)f.select("PostMapper.total", param);
    CHECK(text(param, "total") == "42");

    auto again = MappedObject::create("Count");
    again->set_value("author_id", std::string("10"));
    (void)f.select("PostMapper.total", again);
    CHECK(f.db->count(kTotalPosts) == 1);
    CHECK(text(again, "total") == "42");
}

TEST_CASE("SimpleStatementBackend: update binds inputs and returns affected rows", "[simple_backend]") {
    BackendFixture f;
    f.db->set_handler([](const std::string& sql, const std::vector<Value>& params) {
        if (sql == kRenameAuthor) {
            CHECK(std::get<std::string>(params.at(0)) == "ada");
            CHECK(std::get<int64_t>(params.at(1)) == 7);
            return MockDatabase::affected(1);
        }
        return MockDatabase::rows({"id", "name"}, {{"7", "old"}});
    });

    (void)f.select("AuthorMapper.find", std::string("7"));
    REQUIRE(f.executor->local_cache().size() == 1);

    auto change = MappedObject::create("Author");
    change->set_value("name", std::string("ada"));
    change->set_value("id", int64_t{7});
    CHECK(f.executor->update(*f.config->statement("AuthorMapper.rename"), change) == 1);
    CHECK(f.executor->local_cache().empty());

    CHECK(f.executor->flush_statements().empty());
}
