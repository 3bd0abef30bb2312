#pragma once

#include <atomic>
#include <deque>
#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "BackgroundTasks.hpp"
#include "RenameEngine.hpp"

// Interactive review: scan to preview the planned names, then apply or undo.
class UI : public std::enable_shared_from_this<UI> {
 public:
  explicit UI(RenameEngine& engine);
  void run();

 private:
  void start_scan();
  void execute_plan();
  void start_undo();
  void update_ui_from_plan();

  void AddLogMessage(std::string_view message);
  std::mutex m_log_mutex;
  std::deque<std::string> m_log_messages;

  ftxui::ScreenInteractive m_screen;
  RenameEngine& m_engine;

  RenamePlan m_plan;
  std::vector<std::string> m_plan_entries;
  std::string m_status_text;
  int m_selected_entry = 0;
  BackgroundTasks m_tasks;
  std::atomic<bool> m_is_operation_in_progress = false;

  std::string m_scan_button_label;
  std::string m_apply_button_label;

  ftxui::Component m_plan_component;
  ftxui::Component m_log_component;
  ftxui::Component m_main_container;
};
