#include "Cursor.hpp"
#include "Connection.hpp"
#include "DriverErrors.hpp"
#include "ErrorClassifier.hpp"
#include "LogUtils.hpp"
#include "ResultDecoder.hpp"
#include "StatementSplitter.hpp"
#include "StringUtils.hpp"
#include <algorithm>
#include <chrono>
#include <mutex>

namespace {

bool mentions_credentials(const std::string& sql) {
    return StringUtils::icontains(sql, "aws_key_id") || StringUtils::icontains(sql, "credentials");
}

bool has_values(const std::vector<ParameterSet>& parameter_sets) {
    return std::any_of(parameter_sets.begin(), parameter_sets.end(),
                       [](const ParameterSet& set) { return !set.empty(); });
}

}

Cursor::Cursor(Connection* connection) : connection_(connection) {}

Cursor::~Cursor() {
    close();
}

void Cursor::check_not_closed() const {
    if (closed_) {
        throw CursorClosedError();
    }
}

void Cursor::reset() {
    row_sets_.clear();
    query_id_.reset();
    position_ = 0;
    state_ = CursorState::NONE;
}

int64_t Cursor::execute(const std::string& query, const ParameterSet& parameters, bool skip_parsing) {
    return run(query, {parameters}, skip_parsing, false).rowcount;
}

int64_t Cursor::executemany(const std::string& query,
                            const std::vector<ParameterSet>& parameter_sets,
                            bool skip_parsing) {
    return run(query, parameter_sets, skip_parsing, false).rowcount;
}

std::string Cursor::execute_async(const std::string& query, const ParameterSet& parameters,
                                  bool skip_parsing) {
    return executemany_async(query, {parameters}, skip_parsing);
}

std::string Cursor::executemany_async(const std::string& query,
                                      const std::vector<ParameterSet>& parameter_sets,
                                      bool skip_parsing) {
    return run(query, parameter_sets, skip_parsing, true).query_id.value_or("");
}

Cursor::RunResult Cursor::run(const std::string& query,
                              const std::vector<ParameterSet>& parameter_sets,
                              bool skip_parsing,
                              bool async) {
    check_not_closed();
    std::unique_lock<std::shared_mutex> lock(lock_);
    // close() may have won the lock while this call was waiting
    check_not_closed();
    reset();

    try {
        StatementList statements;
        if (skip_parsing) {
            if (has_values(parameter_sets)) {
                LogUtils::warn("Query parameters are ignored when skip_parsing is set");
            }
            statements.emplace_back(query);
        } else {
            statements = StatementSplitter::split_and_format(query, parameter_sets);
        }

        if (async) {
            if (statements.size() != 1 || is_set_parameter(statements.front())) {
                throw AsyncExecutionUnavailableError(
                    "It is not possible to execute multi-statement queries asynchronously.");
            }
            auto it = set_parameters_.find("use_standard_sql");
            if (it != set_parameters_.end() && it->second == "0") {
                throw AsyncExecutionUnavailableError(
                    "It is not possible to execute queries asynchronously if use_standard_sql=0.");
            }
        }

        for (const auto& statement : statements) {
            if (const auto* parameter = std::get_if<SetParameter>(&statement)) {
                validate_set_parameter(*parameter);
                row_sets_.emplace_back();
            } else if (async) {
                submit_async(std::get<std::string>(statement));
            } else {
                run_query(std::get<std::string>(statement));
            }
        }
        state_ = CursorState::DONE;
    } catch (...) {
        state_ = CursorState::ERROR;
        throw;
    }

    RunResult result;
    result.rowcount = row_sets_.empty() ? -1 : row_sets_.front().rowcount;
    result.query_id = query_id_;
    return result;
}

void Cursor::run_query(const std::string& sql) {
    if (!mentions_credentials(sql)) {
        LogUtils::debug("Running query: {}", sql);
    }
    const auto start = std::chrono::steady_clock::now();

    HttpResponse response = api_request(sql, {{"output_format", JSON_OUTPUT_FORMAT}});
    raise_if_error(response);
    RowSet row_set = ResultDecoder::decode(response.body, decode_options());

    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    LogUtils::info("Query fetched {} rows in {:.3f} seconds", row_set.rowcount, elapsed.count());
    row_sets_.push_back(std::move(row_set));
}

void Cursor::submit_async(const std::string& sql) {
    if (!mentions_credentials(sql)) {
        LogUtils::debug("Submitting asynchronous query: {}", sql);
    }

    HttpResponse response = api_request(sql, {
        {"async_execution", "1"},
        {"advanced_mode", "1"},
        {"output_format", JSON_OUTPUT_FORMAT},
    });
    raise_if_error(response);

    if (response.header("content-length") == std::optional<std::string>("0") ||
        StringUtils::trimmed(response.body).empty()) {
        throw OperationalError("No response to asynchronous query.");
    }

    const nlohmann::json payload = nlohmann::json::parse(response.body, nullptr, false);
    auto it = payload.is_object() ? payload.find("query_id") : payload.end();
    if (!payload.is_object() || it == payload.end() || !it->is_string() ||
        it->get<std::string>().empty()) {
        throw OperationalError("Invalid response to asynchronous query: missing query_id.");
    }

    query_id_ = it->get<std::string>();
    row_sets_.emplace_back();
    LogUtils::info("Asynchronous query submitted with id {}", *query_id_);
}

void Cursor::validate_set_parameter(const SetParameter& parameter) {
    if (parameter.name == "async_execution") {
        throw AsyncExecutionUnavailableError(
            "It is not possible to set async_execution using a SET command. "
            "Instead, use execute_async() or executemany_async().");
    }

    HttpResponse response = api_request("select 1", {
        {parameter.name, parameter.value},
        {"output_format", JSON_OUTPUT_FORMAT},
    });
    if (response.status_code == HttpStatus::BAD_REQUEST) {
        throw InvalidParameterError(response.body);
    }
    raise_if_error(response);

    set_parameters_[parameter.name] = parameter.value;
    LogUtils::debug("Session parameter {} set to {}", parameter.name, parameter.value);
}

HttpResponse Cursor::api_request(const std::string& query,
                                 const QueryParams& params,
                                 const std::string& path,
                                 bool use_set_parameters) {
    QueryParams merged;
    if (use_set_parameters) {
        merged.insert(set_parameters_.begin(), set_parameters_.end());
    }
    for (const auto& [name, value] : params) {
        merged[name] = value;
    }
    if (connection_->database()) {
        merged["database"] = *connection_->database();
    }
    if (connection_->is_system()) {
        merged["account_id"] = connection_->account_id();
    }
    return connection_->transport().request("POST", path.empty() ? "" : "/" + path, merged, query);
}

void Cursor::raise_if_error(const HttpResponse& response) const {
    ErrorClassifier classifier(diagnostics_ ? connection_ : nullptr,
                               connection_->database(),
                               connection_->engine_url());
    classifier.raise_if_error(response);
}

DecodeOptions Cursor::decode_options() const {
    DecodeOptions options;
    auto zone = set_parameters_.find("time_zone");
    if (zone != set_parameters_.end()) {
        options.time_zone = zone->second;
    }
    auto bools = set_parameters_.find("bool_output_format");
    if (bools != set_parameters_.end()) {
        options.bool_output_format = bools->second;
    }
    return options;
}

QueryStatus Cursor::get_status(const std::string& query_id) {
    check_not_closed();
    std::shared_lock<std::shared_mutex> lock(lock_);
    try {
        // output_format must be empty for the status endpoint
        HttpResponse response = api_request("", {{"query_id", query_id}, {"output_format", ""}},
                                            "status", false);
        if (response.status_code == HttpStatus::BAD_REQUEST) {
            throw OperationalError(
                "Asynchronous query " + query_id + " status check failed: " + response.body);
        }
        raise_if_error(response);

        const nlohmann::json payload = response.json();
        auto it = payload.is_object() ? payload.find("status") : payload.end();
        if (!payload.is_object() || it == payload.end() || !it->is_string()) {
            throw OperationalError("Asynchronous query " + query_id +
                                   " status check failed: status not included in server response.");
        }
        return QueryStatusUtils::from_string(it->get<std::string>());
    } catch (...) {
        state_ = CursorState::ERROR;
        throw;
    }
}

void Cursor::cancel(const std::string& query_id) {
    check_not_closed();
    std::shared_lock<std::shared_mutex> lock(lock_);
    HttpResponse response = api_request("", {{"query_id", query_id}, {"output_format", ""}},
                                        "cancel", false);
    if (!response.ok()) {
        LogUtils::warn("Cancel request for query {} returned status {}: {}",
                       query_id, response.status_code, response.body);
    }
}

const RowSet& Cursor::row_set_at(uint64_t position) const {
    return row_sets_[std::min(set_of(position), row_sets_.size() - 1)];
}

std::vector<Row> Cursor::take_rows(std::optional<size_t> limit) {
    check_not_closed();
    if (state_ != CursorState::DONE || row_sets_.empty()) {
        throw NoDataError();
    }

    uint64_t position = position_.load();
    const RowSet* row_set = nullptr;
    size_t start = 0;
    size_t end = 0;
    do {
        row_set = &row_set_at(position);
        if (!row_set->has_rows()) {
            throw NoDataError();
        }
        const size_t total = row_set->size();
        start = offset_of(position);
        if (start >= total) {
            return {};
        }
        end = limit && *limit < total - start ? start + *limit : total;
    } while (!position_.compare_exchange_weak(position, pack_position(set_of(position), end)));

    std::vector<Row> rows;
    rows.reserve(end - start);
    for (size_t i = start; i < end; ++i) {
        rows.push_back(ResultDecoder::decode_row((*row_set->rows)[i], *row_set->columns, row_set->options));
    }
    return rows;
}

std::optional<Row> Cursor::fetchone() {
    std::shared_lock<std::shared_mutex> lock(lock_);
    std::vector<Row> rows = take_rows(1);
    if (rows.empty()) {
        return std::nullopt;
    }
    return std::move(rows.front());
}

std::vector<Row> Cursor::fetchmany(std::optional<size_t> size) {
    std::shared_lock<std::shared_mutex> lock(lock_);
    return take_rows(size.value_or(arraysize_));
}

std::vector<Row> Cursor::fetchall() {
    std::shared_lock<std::shared_mutex> lock(lock_);
    return take_rows(std::nullopt);
}

std::optional<bool> Cursor::nextset() {
    std::shared_lock<std::shared_mutex> lock(lock_);
    check_not_closed();
    if (state_ != CursorState::DONE) {
        throw NoDataError();
    }
    uint64_t position = position_.load();
    do {
        if (set_of(position) + 1 >= row_sets_.size()) {
            return std::nullopt;
        }
    } while (!position_.compare_exchange_weak(position, pack_position(set_of(position) + 1, 0)));
    return true;
}

int64_t Cursor::rowcount() const {
    std::shared_lock<std::shared_mutex> lock(lock_);
    if (row_sets_.empty()) {
        return -1;
    }
    return row_set_at(position_.load()).rowcount;
}

std::optional<ColumnVector> Cursor::description() const {
    std::shared_lock<std::shared_mutex> lock(lock_);
    if (row_sets_.empty()) {
        return std::nullopt;
    }
    return row_set_at(position_.load()).columns;
}

std::optional<Statistics> Cursor::statistics() const {
    std::shared_lock<std::shared_mutex> lock(lock_);
    if (row_sets_.empty()) {
        return std::nullopt;
    }
    return row_set_at(position_.load()).statistics;
}

std::optional<std::string> Cursor::query_id() const {
    std::shared_lock<std::shared_mutex> lock(lock_);
    return query_id_;
}

std::map<std::string, std::string> Cursor::set_parameters() const {
    std::shared_lock<std::shared_mutex> lock(lock_);
    return set_parameters_;
}

void Cursor::flush_parameters() {
    std::unique_lock<std::shared_mutex> lock(lock_);
    set_parameters_.clear();
}

void Cursor::close() {
    if (closed_.exchange(true)) {
        return;
    }
    {
        std::unique_lock<std::shared_mutex> lock(lock_);
        reset();
        set_parameters_.clear();
    }
    connection_->remove_cursor(this);
}
