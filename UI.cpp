#include "UI.hpp"

#include <ftxui/component/component.hpp>
#include <ftxui/dom/elements.hpp>
#include <utility>

#include "IOManager.hpp"
#include "utils.hpp"

using namespace ftxui;

UI::UI(RenameEngine& engine)
    : m_screen(ScreenInteractive::Fullscreen()),
      m_engine(engine),
      m_status_text("Ready. Press 'Scan' to preview the new names."),
      m_scan_button_label("  Scan  "),
      m_apply_button_label(" Apply Renames (Enter) ") {
  IOManager::log("Initializing UI components...");

  try {
    m_plan_component =
        Renderer([&] {
          if (m_plan_entries.empty()) {
            return text(m_status_text) | center;
          }
          Elements elements;
          for (size_t i = 0; i < m_plan_entries.size(); ++i) {
            Element entry = text(m_plan_entries[i]);
            if ((int)i == m_selected_entry) {
              entry = entry | inverted | focus;
            }
            elements.push_back(entry);
          }
          return vbox(elements) | vscroll_indicator | frame;
        }) |
        CatchEvent([&](Event event) {
          if (m_is_operation_in_progress) {
            return false;
          }
          if (event.is_mouse()) return false;
          if (event == Event::ArrowUp && m_selected_entry > 0) {
            m_selected_entry--;
          } else if (event == Event::ArrowDown &&
                     m_selected_entry < (int)m_plan_entries.size() - 1) {
            m_selected_entry++;
          } else if (event == Event::Return && !m_plan.records.empty()) {
            execute_plan();
          } else {
            return false;
          }
          return true;
        });

    m_log_component = Renderer([&] {
      Elements logs;
      {
        std::scoped_lock lock(m_log_mutex);
        for (const auto& msg : m_log_messages) {
          logs.push_back(text(msg));
        }
      }
      return vbox(logs) | vscroll_indicator | frame | flex;
    });

  } catch (const std::exception& e) {
    IOManager::log(std::format(
        "CRITICAL: Failed to initialize UI components: {}", e.what()));
    throw;
  }
}

void UI::AddLogMessage(std::string_view message) {
  {
    std::scoped_lock lock(m_log_mutex);
    m_log_messages.push_back(std::string(message));
    if (m_log_messages.size() > 100) {
      m_log_messages.pop_front();
    }
  }
  m_screen.Post(Event::Custom);
}

void UI::update_ui_from_plan() {
  m_plan_entries.clear();
  m_selected_entry = 0;
  for (const auto& rec : m_plan.records) {
    m_plan_entries.push_back(std::format("{:>3}  {}  ->  {}  [{}]",
                                         rec.location_sequence,
                                         rec.original_name, rec.new_name,
                                         rec.place_slug));
  }
  if (m_plan.records.empty()) {
    m_status_text = "Scan complete. No geotagged photos found.";
  } else {
    m_status_text = std::format(
        "{} photos in {} locations ({} geocoded). Press Enter to rename.",
        m_plan.summary.photos_considered, m_plan.summary.groups_formed,
        m_plan.summary.groups_geocoded);
  }
}

void UI::start_scan() {
  if (m_is_operation_in_progress) {
    return;
  }
  m_is_operation_in_progress = true;
  m_status_text = "Scanning and geocoding... Please wait.";

  m_tasks.start([self = shared_from_this()](std::stop_token stoken) {
    try {
      IOManager::log("Starting scan...");
      RenamePlan plan_result = self->m_engine.generate_plan();

      if (stoken.stop_requested()) {
        IOManager::log("Scan was cancelled, UI will not be updated.");
        self->m_is_operation_in_progress = false;
        return;
      }

      self->m_screen.Post(
          [self, plan_result = std::move(plan_result)]() mutable {
            self->m_plan = std::move(plan_result);
            self->update_ui_from_plan();
          });
    } catch (const std::exception& e) {
      IOManager::log(std::format("ERROR during scan: {}", e.what()));
      self->m_screen.Post([self, error_msg = std::string(e.what())] {
        self->m_status_text = "Scan failed: " + error_msg;
      });
    }
    self->m_is_operation_in_progress = false;
  });
}

void UI::execute_plan() {
  if (m_is_operation_in_progress || m_plan.records.empty()) return;

  IOManager::log("Executing plan...");
  m_status_text = "Renaming in progress...";
  m_is_operation_in_progress = true;

  m_tasks.start([self = shared_from_this(),
                 plan = std::move(m_plan)](std::stop_token) mutable {
    try {
      const RunSummary summary = self->m_engine.execute_plan(plan, false);
      IOManager::log("Execution complete.");

      self->m_screen.Post([self, summary] {
        self->m_plan = {};
        self->update_ui_from_plan();
        self->m_status_text = std::format(
            "Renamed {} photos. Undo is available until the next apply.",
            summary.renamed);
      });
    } catch (const std::exception& e) {
      IOManager::log(
          std::format("CRITICAL ERROR in execute_plan: {}", e.what()));
      self->m_screen.Post([self, error_msg = std::string(e.what())] {
        self->m_plan = {};
        self->update_ui_from_plan();
        self->m_status_text = "Rename failed: " + error_msg;
      });
    }
    self->m_is_operation_in_progress = false;
  });
}

void UI::start_undo() {
  if (m_is_operation_in_progress) return;

  m_is_operation_in_progress = true;
  m_status_text = "Undoing last rename...";

  m_tasks.start([self = shared_from_this()](std::stop_token) {
    try {
      const bool undone =
          IOManager::run_undo(self->m_engine.options().journal_path);
      self->m_screen.Post([self, undone] {
        self->m_plan = {};
        self->update_ui_from_plan();
        self->m_status_text =
            undone ? "Undo complete. Scan again to re-plan."
                   : "Nothing to undo.";
      });
    } catch (const std::exception& e) {
      IOManager::log(std::format("ERROR during undo: {}", e.what()));
      self->m_screen.Post([self, error_msg = std::string(e.what())] {
        self->m_status_text = "Undo failed: " + error_msg;
      });
    }
    self->m_is_operation_in_progress = false;
  });
}

void UI::run() {
  try {
    IOManager::set_log_handler(
        [this](std::string_view message) { this->AddLogMessage(message); });

    auto scan_button = Button(&m_scan_button_label, [this] { start_scan(); });
    auto undo_button = Button("  Undo  ", [this] { start_undo(); });

    auto quit_button = Button("  Quit  ", [this] {
      IOManager::log("Quit requested. Stopping worker threads...");
      m_tasks.request_stop();
      m_screen.Exit();
    });

    auto apply_button = Button(&m_apply_button_label, [&] {
      if (m_is_operation_in_progress || m_plan.records.empty()) {
        return;
      }
      execute_plan();
    });

    auto top_menu =
        Container::Horizontal({scan_button, undo_button, quit_button});

    auto main_layout =
        Container::Vertical({top_menu, m_plan_component, apply_button});

    m_main_container = Container::Vertical({
        main_layout,
        m_log_component,
    });

    auto final_renderer = Renderer(m_main_container, [&] {
      bool is_busy = m_is_operation_in_progress;
      bool can_apply = !m_plan.records.empty() && !is_busy;

      m_scan_button_label = is_busy ? "  Busy...  " : "  Scan  ";
      m_apply_button_label =
          is_busy ? "  Busy...  " : " Apply Renames (Enter) ";

      Element apply_button_element = apply_button->Render();

      if (!can_apply) {
        apply_button_element = apply_button_element | dim;
      }

      const auto& options = m_engine.options();
      const std::string mode =
          options.output_dir.empty() ? "in place" : "to " +
              safe_path_to_string(options.output_dir);

      auto top_pane = vbox(
          {hbox({text(" GeoPhoto Renamer ") | bold, filler(),
                 text(safe_path_to_string(options.input_dir) + " (" + mode +
                      ")")}) |
               color(Color::White) | bgcolor(Color::Blue),
           top_menu->Render(), separator(), m_plan_component->Render() | flex,
           separator(),
           hbox({text(" " + m_status_text), filler(), apply_button_element})});

      auto log_pane =
          vbox({text("Log Output") | bold, m_log_component->Render() | flex});

      return vbox({top_pane | flex_grow, separator(),
                   log_pane | size(HEIGHT, EQUAL, 10)}) |
             border;
    });

    IOManager::log("Starting UI event loop...");
    m_screen.Loop(final_renderer);
    IOManager::log("UI event loop exited. Waiting for threads to join...");
    m_tasks.join_all();

    IOManager::log("All threads joined. Exiting.");
    IOManager::set_log_handler(nullptr);

  } catch (const std::exception& e) {
    IOManager::log(
        std::format("CRITICAL: Exception in UI::run(): {}", e.what()));
    throw;
  }
}
