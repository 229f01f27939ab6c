#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <stdexcept>

#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_queries.hpp"

namespace flowsched::db::sqlite {

using flowsched::db::ErrorCode;
using flowsched::db::Result;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StmtPtr Prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
        sqlite3_finalize(st);
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
    return StmtPtr(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s.has_value()) {
        BindText(st, idx, *s);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColText(st, col);
}

int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

model::DeploymentRecord ReadDeployment(sqlite3_stmt* st) {
    model::DeploymentRecord r;
    r.id = ColText(st, 0);
    r.name = ColText(st, 1);
    r.flow_id = ColText(st, 2);
    r.created_at_ms = ColU64(st, 3);
    return r;
}

model::FlowRunRecord ReadFlowRun(sqlite3_stmt* st) {
    model::FlowRunRecord r;
    r.id = ColText(st, 0);
    r.flow_id = ColText(st, 1);
    r.deployment_id = ColText(st, 2);
    r.parameters = ColText(st, 3);
    r.idempotency_key = ColText(st, 4);
    r.tags = ColText(st, 5);
    r.schedule_id = ColText(st, 6);
    r.auto_scheduled = sqlite3_column_int(st, 7) != 0;
    r.state_id = ColOptText(st, 8);
    r.created_at_ms = ColU64(st, 9);
    return r;
}

// Splits `ids` into statement-sized chunks.
template <typename Fn>
Result ForEachChunk(const std::vector<std::string>& ids, Fn&& fn) {
    for (std::size_t begin = 0; begin < ids.size(); begin += sql::kMaxBatchRows) {
        const std::size_t end = std::min(ids.size(), begin + sql::kMaxBatchRows);
        auto result = fn(begin, end);
        if (!result) return result;
    }
    return Result::Ok();
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

bool SqliteRepository::SupportsUpdateJoin() {
    return sqlite3_libversion_number() >= 3033000;
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT: {
            const int ext = sqlite3_extended_errcode(db);
            if (ext == SQLITE_CONSTRAINT_UNIQUE || ext == SQLITE_CONSTRAINT_PRIMARYKEY)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        }
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Deployments
// ------------------------------------------------------------------

Result SqliteRepository::InsertDeployment(Transaction& t, const model::DeploymentRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_DEPLOYMENT, -1, &raw, nullptr) != SQLITE_OK) {
        sqlite3_finalize(raw);
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
    StmtPtr st(raw, &sqlite3_finalize);

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.name);
    BindText(st.get(), 3, r.flow_id);
    BindU64(st.get(), 4, r.created_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::DeploymentRecord>
SqliteRepository::GetDeployment(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, sql::SELECT_DEPLOYMENT);

    BindText(st.get(), 1, id);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) throw std::runtime_error(Translate(db, rc).message);

    return ReadDeployment(st.get());
}

std::vector<model::DeploymentRecord>
SqliteRepository::ListDeployments(Transaction& t, uint64_t offset, std::optional<uint64_t> limit) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, sql::SELECT_DEPLOYMENTS);

    // negative LIMIT means no limit in sqlite
    BindI64(st.get(), 1, limit.has_value() ? static_cast<int64_t>(*limit) : -1);
    BindU64(st.get(), 2, offset);

    std::vector<model::DeploymentRecord> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(ReadDeployment(st.get()));
    }
    if (rc != SQLITE_DONE) throw std::runtime_error(Translate(db, rc).message);
    return out;
}

Result SqliteRepository::DeleteDeployment(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql::DELETE_DEPLOYMENT, -1, &raw, nullptr) != SQLITE_OK) {
        sqlite3_finalize(raw);
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
    StmtPtr st(raw, &sqlite3_finalize);

    BindText(st.get(), 1, id);
    auto result = Translate(db, sqlite3_step(st.get()));
    if (!result) return result;

    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "deployment " + id);
    return Result::Ok();
}

// ------------------------------------------------------------------
// Schedules
// ------------------------------------------------------------------

Result SqliteRepository::InsertSchedule(Transaction& t, const model::ScheduleRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_SCHEDULE, -1, &raw, nullptr) != SQLITE_OK) {
        sqlite3_finalize(raw);
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
    StmtPtr st(raw, &sqlite3_finalize);

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.deployment_id);
    BindU64(st.get(), 3, r.interval_seconds);
    BindI64(st.get(), 4, r.anchor_ms);
    BindText(st.get(), 5, r.parameters);
    BindU64(st.get(), 6, r.created_at_ms);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result.code == ErrorCode::ConstraintViolation &&
        sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_FOREIGNKEY) {
        return Result::Err(ErrorCode::NotFound, "deployment " + r.deployment_id);
    }
    return result;
}

std::vector<model::ScheduleRecord>
SqliteRepository::ListSchedules(Transaction& t, const std::string& deployment_id) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, sql::SELECT_SCHEDULES);

    BindText(st.get(), 1, deployment_id);

    std::vector<model::ScheduleRecord> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        model::ScheduleRecord r;
        r.id = ColText(st.get(), 0);
        r.deployment_id = ColText(st.get(), 1);
        r.interval_seconds = ColU64(st.get(), 2);
        r.anchor_ms = ColI64(st.get(), 3);
        r.parameters = ColText(st.get(), 4);
        r.created_at_ms = ColU64(st.get(), 5);
        out.push_back(std::move(r));
    }
    if (rc != SQLITE_DONE) throw std::runtime_error(Translate(db, rc).message);
    return out;
}

Result SqliteRepository::DeleteSchedule(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql::DELETE_SCHEDULE, -1, &raw, nullptr) != SQLITE_OK) {
        sqlite3_finalize(raw);
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
    StmtPtr st(raw, &sqlite3_finalize);

    BindText(st.get(), 1, id);
    auto result = Translate(db, sqlite3_step(st.get()));
    if (!result) return result;

    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "schedule " + id);
    return Result::Ok();
}

// ------------------------------------------------------------------
// Flow runs
// ------------------------------------------------------------------

Result SqliteRepository::InsertFlowRunsIgnoreConflicts(
    Transaction& t, const std::vector<model::FlowRunRecord>& runs) {
    if (runs.empty()) return Result::Ok();

    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_FLOW_RUN_IGNORE, -1, &raw, nullptr) != SQLITE_OK) {
        sqlite3_finalize(raw);
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
    StmtPtr st(raw, &sqlite3_finalize);

    for (const auto& r : runs) {
        sqlite3_reset(st.get());
        sqlite3_clear_bindings(st.get());

        BindText(st.get(), 1, r.id);
        BindText(st.get(), 2, r.flow_id);
        BindText(st.get(), 3, r.deployment_id);
        BindText(st.get(), 4, r.parameters);
        BindText(st.get(), 5, r.idempotency_key);
        BindText(st.get(), 6, r.tags);
        BindText(st.get(), 7, r.schedule_id);
        sqlite3_bind_int(st.get(), 8, r.auto_scheduled ? 1 : 0);
        BindOptText(st.get(), 9, r.state_id);
        BindU64(st.get(), 10, r.created_at_ms);

        int rc = sqlite3_step(st.get());
        if (rc != SQLITE_DONE) {
            return Translate(db, rc);
        }
    }

    return Result::Ok();
}

Result SqliteRepository::ListStatelessFlowRunIds(
    Transaction& t, const std::vector<std::string>& ids, std::vector<std::string>& out) {
    auto* db = TX(t).Handle();

    return ForEachChunk(ids, [&](std::size_t begin, std::size_t end) {
        const std::string query = std::string(sql::SELECT_STATELESS_FLOW_RUNS_PREFIX) +
                                  sql::Placeholders(end - begin, sql::PlaceholderStyle::kQuestion) + ");";

        sqlite3_stmt* raw = nullptr;
        if (sqlite3_prepare_v2(db, query.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
            sqlite3_finalize(raw);
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
        }
        StmtPtr st(raw, &sqlite3_finalize);

        int idx = 1;
        for (std::size_t i = begin; i < end; ++i) {
            BindText(st.get(), idx++, ids[i]);
        }

        int rc;
        while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
            out.push_back(ColText(st.get(), 0));
        }
        return Translate(db, rc);
    });
}

Result SqliteRepository::InsertFlowRunStates(
    Transaction& t, const std::vector<model::FlowRunStateRecord>& states) {
    if (states.empty()) return Result::Ok();

    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_FLOW_RUN_STATE, -1, &raw, nullptr) != SQLITE_OK) {
        sqlite3_finalize(raw);
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
    StmtPtr st(raw, &sqlite3_finalize);

    for (const auto& s : states) {
        sqlite3_reset(st.get());
        sqlite3_clear_bindings(st.get());

        BindText(st.get(), 1, s.id);
        BindText(st.get(), 2, s.flow_run_id);
        sqlite3_bind_int(st.get(), 3, static_cast<int>(s.type));
        BindText(st.get(), 4, s.message);
        BindText(st.get(), 5, s.state_details);
        BindU64(st.get(), 6, s.created_at_ms);

        int rc = sqlite3_step(st.get());
        if (rc != SQLITE_DONE) {
            return Translate(db, rc);
        }
    }

    return Result::Ok();
}

Result SqliteRepository::LinkFlowRunStates(
    Transaction& t, StateLinkStrategy strategy, const std::vector<std::string>& state_ids) {
    if (strategy == StateLinkStrategy::kUpdateJoin && !SupportsUpdateJoin()) {
        return Result::Err(ErrorCode::Unsupported,
                           std::string("UPDATE ... FROM requires sqlite 3.33, have ") + sqlite3_libversion());
    }

    auto* db = TX(t).Handle();

    return ForEachChunk(state_ids, [&](std::size_t begin, std::size_t end) {
        const auto list = sql::Placeholders(end - begin, sql::PlaceholderStyle::kQuestion);

        std::string query;
        int         bind_rounds = 1;
        if (strategy == StateLinkStrategy::kUpdateJoin) {
            query =
                "UPDATE flow_run SET state_id = flow_run_state.id FROM flow_run_state"
                " WHERE flow_run_state.flow_run_id = flow_run.id AND flow_run_state.id IN (" + list + ");";
        } else {
            query =
                "UPDATE flow_run SET state_id = (SELECT flow_run_state.id FROM flow_run_state"
                " WHERE flow_run_state.flow_run_id = flow_run.id AND flow_run_state.id IN (" + list + ") LIMIT 1)"
                " WHERE flow_run.id IN (SELECT flow_run_id FROM flow_run_state WHERE id IN (" + list + "));";
            bind_rounds = 2;
        }

        sqlite3_stmt* raw = nullptr;
        if (sqlite3_prepare_v2(db, query.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
            sqlite3_finalize(raw);
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
        }
        StmtPtr st(raw, &sqlite3_finalize);

        int idx = 1;
        for (int round = 0; round < bind_rounds; ++round) {
            for (std::size_t i = begin; i < end; ++i) {
                BindText(st.get(), idx++, state_ids[i]);
            }
        }

        return Translate(db, sqlite3_step(st.get()));
    });
}

std::optional<model::FlowRunRecord>
SqliteRepository::GetFlowRun(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, sql::SELECT_FLOW_RUN);

    BindText(st.get(), 1, id);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) throw std::runtime_error(Translate(db, rc).message);

    return ReadFlowRun(st.get());
}

std::vector<model::FlowRunRecord>
SqliteRepository::ListFlowRuns(Transaction& t, const std::string& deployment_id) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, sql::SELECT_FLOW_RUNS_BY_DEPLOYMENT);

    BindText(st.get(), 1, deployment_id);

    std::vector<model::FlowRunRecord> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(ReadFlowRun(st.get()));
    }
    if (rc != SQLITE_DONE) throw std::runtime_error(Translate(db, rc).message);
    return out;
}

std::vector<model::FlowRunStateRecord>
SqliteRepository::ListFlowRunStates(Transaction& t, const std::string& flow_run_id) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, sql::SELECT_FLOW_RUN_STATES);

    BindText(st.get(), 1, flow_run_id);

    std::vector<model::FlowRunStateRecord> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        model::FlowRunStateRecord s;
        s.id = ColText(st.get(), 0);
        s.flow_run_id = ColText(st.get(), 1);
        s.type = static_cast<flowsched::core::v1::StateType>(sqlite3_column_int(st.get(), 2));
        s.message = ColText(st.get(), 3);
        s.state_details = ColText(st.get(), 4);
        s.created_at_ms = ColU64(st.get(), 5);
        out.push_back(std::move(s));
    }
    if (rc != SQLITE_DONE) throw std::runtime_error(Translate(db, rc).message);
    return out;
}

} // namespace flowsched::db::sqlite
