#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_future.hpp>
#include <memory>
#include <thread>
#include <utility>

namespace scroll_driver::driver {

/**
 * @brief Dedicated thread that owns everything the UI toolkit requires to run on its main thread.
 *
 * Work is handed over with run_on_main_sync(), which blocks the caller until the work
 * finished on the main thread. The thread is stopped and joined on destruction.
 */
class main_thread
{
public:
  main_thread();

  main_thread(const main_thread &) = delete;
  auto operator=(const main_thread &) -> main_thread & = delete;
  main_thread(main_thread &&) = delete;
  auto operator=(main_thread &&) -> main_thread & = delete;
  ~main_thread();

  /**
   * @brief Runs a task on the main thread and waits for its result.
   *
   * Runs inline when already called from the main thread.
   *
   * @param task Callable to run
   * @return Whatever task returns
   * @throws Whatever task throws
   */
  template<typename Task> auto run_on_main_sync(Task &&task) -> decltype(task())
  {
    if (is_current()) { return std::forward<Task>(task)(); }
    auto result = boost::asio::post(*io_context_, boost::asio::use_future(std::forward<Task>(task)));
    return result.get();
  }

  [[nodiscard]] auto is_current() const -> bool { return std::this_thread::get_id() == thread_.get_id(); }

private:
  std::shared_ptr<boost::asio::io_context> io_context_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::thread thread_;
};

}// namespace scroll_driver::driver
