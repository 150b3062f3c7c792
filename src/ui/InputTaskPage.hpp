/**
 * @file InputTaskPage.hpp
 * @brief The single HTML page of the web UI.
 */

#pragma once

#include <string>

namespace tasktracker::ui {

/**
 * @brief Static add-task form. Posts task_name, task_start, task_time and
 * repeat_info back to "/".
 */
const std::string& InputTaskPage();

} // namespace tasktracker::ui
