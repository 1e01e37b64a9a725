#include <driver/main_thread.hpp>

#include <spdlog/spdlog.h>

namespace scroll_driver::driver {

main_thread::main_thread()
  : io_context_(std::make_shared<boost::asio::io_context>()), work_guard_(boost::asio::make_work_guard(*io_context_)),
    thread_([io_context = io_context_]() { io_context->run(); })
{
  spdlog::trace("[main_thread] Started");
}

main_thread::~main_thread()
{
  work_guard_.reset();
  io_context_->stop();
  if (thread_.joinable()) { thread_.join(); }
  spdlog::trace("[main_thread] Stopped");
}

}// namespace scroll_driver::driver
