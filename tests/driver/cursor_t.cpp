#include "../../src/driver/buffered_cursor.hxx"
#include "../../src/driver/read_ahead_cursor.hxx"
#include "../../src/driver/stream_cursor.hxx"
#include "driver_env.h"
#include <gtest/gtest.h>
#include <ledger/driver/exceptions.hxx>

using namespace ledger::driver;

static const std::string QUERY("SELECT * FROM Vehicle");

class CursorTests : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        endpoint_ = std::make_shared<fake_endpoint>();
        token_ = endpoint_->start_session("vehicle-registration").session_token;
        txn_ = endpoint_->start_transaction(token_).transaction_id;
    }

    std::shared_ptr<stream_cursor> stream()
    {
        return std::make_shared<stream_cursor>(endpoint_, token_, txn_, endpoint_->execute_statement(token_, txn_, QUERY, {}));
    }

    std::shared_ptr<read_ahead_cursor> read_ahead(size_t window, const boost::optional<task_executor>& executor = boost::none)
    {
        return std::make_shared<read_ahead_cursor>(
          endpoint_, token_, txn_, endpoint_->execute_statement(token_, txn_, QUERY, {}), window, executor);
    }

    static std::vector<nlohmann::json> drain(cursor& c)
    {
        std::vector<nlohmann::json> rows;
        while (auto row = c.next()) {
            rows.push_back(*row);
        }
        return rows;
    }

    std::shared_ptr<fake_endpoint> endpoint_;
    std::string token_;
    std::string txn_;
};

TEST_F(CursorTests, StreamReadsEveryPage)
{
    endpoint_->script(QUERY, numbered_pages(10, 3));
    auto c = stream();
    auto rows = drain(*c);
    ASSERT_EQ(10u, rows.size());
    for (size_t i = 0; i < rows.size(); i++) {
        ASSERT_EQ(i, rows[i]["n"].get<size_t>());
    }
    ASSERT_EQ(3, endpoint_->fetch_page_calls.load());
    // stays exhausted
    ASSERT_FALSE(c->next());
}

TEST_F(CursorTests, StreamSkipsEmptyPages)
{
    auto row = [](int n) { return nlohmann::json{ { "n", n } }; };
    std::vector<std::vector<nlohmann::json>> pages{ {}, { row(0) }, {}, {}, { row(1) }, {} };
    endpoint_->script(QUERY, pages);
    auto rows = drain(*stream());
    ASSERT_EQ(2u, rows.size());
    ASSERT_EQ(0, rows[0]["n"].get<int>());
    ASSERT_EQ(1, rows[1]["n"].get<int>());
}

TEST_F(CursorTests, EmptyResult)
{
    auto c = stream();
    ASSERT_FALSE(c->next());
    auto r = read_ahead(2);
    ASSERT_FALSE(r->next());
}

TEST_F(CursorTests, StreamAccumulatesStats)
{
    endpoint_->script(QUERY, numbered_pages(9, 3));
    auto c = stream();
    drain(*c);
    ASSERT_TRUE(c->consumed_ios());
    // first page reports 1 read and 2 writes, each further page 1 read
    ASSERT_EQ(3, c->consumed_ios()->read_ios);
    ASSERT_EQ(2, c->consumed_ios()->write_ios);
    ASSERT_TRUE(c->timing());
    ASSERT_EQ(3, c->timing()->processing_time_milliseconds);
}

TEST_F(CursorTests, StatsAbsentWhenNotReported)
{
    endpoint_->report_stats = false;
    endpoint_->script(QUERY, numbered_pages(4, 2));
    auto c = stream();
    drain(*c);
    ASSERT_FALSE(c->consumed_ios());
    ASSERT_FALSE(c->timing());
}

TEST_F(CursorTests, ReadAheadYieldsSameRowsAsStream)
{
    endpoint_->script(QUERY, numbered_pages(25, 2));
    auto expected = drain(*stream());
    for (size_t window : { 2, 3, 5, 20 }) {
        auto c = read_ahead(window);
        ASSERT_EQ(expected, drain(*c)) << "window " << window;
    }
}

TEST_F(CursorTests, ReadAheadAccumulatesSameStatsAsStream)
{
    endpoint_->script(QUERY, numbered_pages(12, 4));
    auto s = stream();
    drain(*s);
    auto r = read_ahead(3);
    drain(*r);
    ASSERT_EQ(s->consumed_ios()->read_ios, r->consumed_ios()->read_ios);
    ASSERT_EQ(s->consumed_ios()->write_ios, r->consumed_ios()->write_ios);
    ASSERT_EQ(s->timing()->processing_time_milliseconds, r->timing()->processing_time_milliseconds);
}

TEST_F(CursorTests, ReadAheadBuffersAtMostWindowLessOne)
{
    endpoint_->script(QUERY, numbered_pages(20, 1));
    const size_t window = 4;
    auto c = read_ahead(window);
    // give the worker time to fill the queue
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    ASSERT_EQ(window - 1, c->pages_buffered());
    size_t rows = 0;
    while (c->next()) {
        rows++;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        ASSERT_LE(c->pages_buffered(), window - 1);
    }
    ASSERT_EQ(20u, rows);
    ASSERT_LE(c->max_pages_buffered(), window - 1);
}

TEST_F(CursorTests, ReadAheadRejectsWindowOfOne)
{
    ASSERT_THROW(read_ahead(1), std::invalid_argument);
}

TEST_F(CursorTests, ReadAheadReportsFetchErrors)
{
    endpoint_->script(QUERY, numbered_pages(6, 2));
    endpoint_->fetch_page_errors.push_back(service_unavailable());
    auto c = read_ahead(3);
    ASSERT_TRUE(c->next());
    ASSERT_TRUE(c->next());
    ASSERT_THROW(c->next(), ledger::endpoint_error);
    // the failure sticks
    ASSERT_THROW(c->next(), ledger::endpoint_error);
}

TEST_F(CursorTests, StreamReportsFetchErrors)
{
    endpoint_->script(QUERY, numbered_pages(4, 2));
    endpoint_->fetch_page_errors.push_back(no_response());
    auto c = stream();
    ASSERT_TRUE(c->next());
    ASSERT_TRUE(c->next());
    ASSERT_THROW(c->next(), ledger::endpoint_error);
}

TEST_F(CursorTests, ClosedCursorThrows)
{
    endpoint_->script(QUERY, numbered_pages(4, 2));
    auto s = stream();
    ASSERT_TRUE(s->is_open());
    s->close();
    ASSERT_FALSE(s->is_open());
    ASSERT_THROW(s->next(), result_closed);
    auto r = read_ahead(2);
    r->close();
    ASSERT_THROW(r->next(), result_closed);
}

TEST_F(CursorTests, ClosingStopsReadAheadWorker)
{
    endpoint_->script(QUERY, numbered_pages(100, 1));
    auto c = read_ahead(2);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    c->close();
    // let the worker notice on its next push timeout
    std::this_thread::sleep_for(READ_AHEAD_PUSH_TIMEOUT * 4);
    auto fetches = endpoint_->fetch_page_calls.load();
    std::this_thread::sleep_for(READ_AHEAD_PUSH_TIMEOUT * 4);
    ASSERT_EQ(fetches, endpoint_->fetch_page_calls.load());
    ASSERT_LT(fetches, 10);
}

TEST_F(CursorTests, ReadAheadUsesTaskExecutor)
{
    endpoint_->script(QUERY, numbered_pages(10, 2));
    std::vector<std::thread> threads;
    std::atomic<int> tasks{ 0 };
    task_executor executor = [&](std::function<void()> task) {
        tasks++;
        threads.emplace_back(std::move(task));
    };
    {
        auto c = read_ahead(3, executor);
        ASSERT_EQ(10u, drain(*c).size());
    }
    for (auto& t : threads) {
        t.join();
    }
    ASSERT_EQ(1, tasks.load());
}

TEST_F(CursorTests, DestroyingUnreadReadAheadCursorIsPrompt)
{
    endpoint_->script(QUERY, numbered_pages(100, 1));
    auto start = std::chrono::steady_clock::now();
    {
        auto c = read_ahead(2);
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    ASSERT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
}

TEST_F(CursorTests, BufferedCursorDrainsSource)
{
    endpoint_->script(QUERY, numbered_pages(7, 3));
    auto s = stream();
    buffered_cursor b(*s);
    ASSERT_EQ(7u, b.size());
    ASSERT_FALSE(s->next());
    // buffered rows outlive the source
    s->close();
    auto rows = drain(b);
    ASSERT_EQ(7u, rows.size());
    ASSERT_EQ(6, rows.back()["n"].get<int>());
    ASSERT_EQ(s->consumed_ios()->read_ios, b.consumed_ios()->read_ios);
    b.close();
    ASSERT_FALSE(b.next());
}

TEST_F(CursorTests, MaterializeBuffersOpenLiveCursors)
{
    endpoint_->script(QUERY, numbered_pages(5, 2));
    std::shared_ptr<cursor> result = stream();
    detail::materialize(result);
    ASSERT_TRUE(std::dynamic_pointer_cast<buffered_cursor>(result));
    ASSERT_EQ(5u, drain(*result).size());

    // already buffered, left alone
    auto before = result;
    detail::materialize(result);
    ASSERT_EQ(before, result);

    int other = 3;
    detail::materialize(other);
    ASSERT_EQ(3, other);
}
