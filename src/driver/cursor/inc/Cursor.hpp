#pragma once

#include "ColType.hpp"
#include "HttpTransport.hpp"
#include "QueryStatus.hpp"
#include "RowSet.hpp"
#include "Statement.hpp"
#include <atomic>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

class Connection;

enum class CursorState {
    NONE,   // nothing executed since the last reset
    DONE,   // last execute succeeded
    ERROR   // last execute or status check failed
};

/**
 * Submits queries over the owning connection's transport and iterates their
 * result sets. One query runs at a time per cursor: execute and close take the
 * exclusive side of a reader/writer lock, while fetches and nextset take the
 * shared side and claim disjoint row slices, so several threads may read one
 * completed result concurrently.
 */
class Cursor {
public:
    static constexpr const char* JSON_OUTPUT_FORMAT = "JSON_Compact";

    // Cursors are created by Connection::cursor()
    explicit Cursor(Connection* connection);
    ~Cursor();

    Cursor(const Cursor&) = delete;
    Cursor& operator=(const Cursor&) = delete;

    /**
     * Run a query template, one statement after another.
     * @return Row count of the first statement, -1 when it returned no rows
     * @throws DriverError subclasses; the cursor state becomes ERROR
     */
    int64_t execute(const std::string& query,
                    const ParameterSet& parameters = {},
                    bool skip_parsing = false);

    // execute() repeated for each parameter set, results in set order
    int64_t executemany(const std::string& query,
                        const std::vector<ParameterSet>& parameter_sets,
                        bool skip_parsing = false);

    /**
     * Submit a single statement for server-side asynchronous execution.
     * @return The server-assigned query id, to be polled with get_status()
     * @throws AsyncExecutionUnavailableError For multi-statement or SET queries
     * @throws OperationalError When the server does not return a query id
     */
    std::string execute_async(const std::string& query,
                              const ParameterSet& parameters = {},
                              bool skip_parsing = false);

    std::string executemany_async(const std::string& query,
                                  const std::vector<ParameterSet>& parameter_sets,
                                  bool skip_parsing = false);

    // std::nullopt once the current result set is exhausted
    std::optional<Row> fetchone();

    // Up to `size` rows, arraysize() when not given
    std::vector<Row> fetchmany(std::optional<size_t> size = std::nullopt);

    std::vector<Row> fetchall();

    // Move to the next result set; std::nullopt when there is none
    std::optional<bool> nextset();

    template <typename Fn>
    void for_each_row(Fn&& fn) {
        while (auto row = fetchone()) {
            fn(*row);
        }
    }

    QueryStatus get_status(const std::string& query_id);

    // Request cancellation of a server-side asynchronous query; poll get_status() to confirm
    void cancel(const std::string& query_id);

    int64_t rowcount() const;
    std::optional<ColumnVector> description() const;
    std::optional<Statistics> statistics() const;
    std::optional<std::string> query_id() const;

    size_t arraysize() const { return arraysize_; }
    void set_arraysize(size_t size) { arraysize_ = size == 0 ? 1 : size; }

    // Snapshot of the session parameters accepted from SET statements
    std::map<std::string, std::string> set_parameters() const;
    void flush_parameters();

    CursorState state() const { return state_; }
    bool closed() const { return closed_; }
    void close();

    // Cursors used for control-plane probes must not probe again on failure
    void set_diagnostics(bool enabled) { diagnostics_ = enabled; }

private:
    // Outcome of one execute, read while the exclusive lock is still held
    struct RunResult {
        int64_t rowcount = -1;
        std::optional<std::string> query_id;
    };

    RunResult run(const std::string& query,
                  const std::vector<ParameterSet>& parameter_sets,
                  bool skip_parsing,
                  bool async);
    void reset();
    void run_query(const std::string& sql);
    void submit_async(const std::string& sql);
    void validate_set_parameter(const SetParameter& parameter);

    HttpResponse api_request(const std::string& query,
                             const QueryParams& params,
                             const std::string& path = "",
                             bool use_set_parameters = true);
    void raise_if_error(const HttpResponse& response) const;
    DecodeOptions decode_options() const;

    void check_not_closed() const;
    const RowSet& row_set_at(uint64_t position) const;
    // Claims up to `limit` rows of the current set, the whole rest when not given
    std::vector<Row> take_rows(std::optional<size_t> limit);

    // Result set index in the high half, row offset in the low half, so a
    // fetch claims rows and nextset moves on in a single atomic step
    static uint64_t pack_position(size_t set, size_t offset) {
        return (static_cast<uint64_t>(set) << 32) | static_cast<uint32_t>(offset);
    }
    static size_t set_of(uint64_t position) { return static_cast<size_t>(position >> 32); }
    static size_t offset_of(uint64_t position) { return static_cast<size_t>(position & 0xffffffffu); }

    Connection* connection_;

    mutable std::shared_mutex lock_;
    std::vector<RowSet> row_sets_;
    std::map<std::string, std::string> set_parameters_;
    std::optional<std::string> query_id_;

    std::atomic<uint64_t> position_{0};
    std::atomic<CursorState> state_{CursorState::NONE};
    std::atomic<bool> closed_{false};
    std::atomic<size_t> arraysize_{1};
    std::atomic<bool> diagnostics_{true};
};
