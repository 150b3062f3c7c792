/**
 * @file InputTaskPage.cpp
 * @brief Markup of the add-task form.
 */

#include "ui/InputTaskPage.hpp"

namespace tasktracker::ui {

const std::string& InputTaskPage() {
    // Option values must match TaskFormValidator::RepeatKeywordTable().
    static const std::string page = R"HTML(<!DOCTYPE html>
<html lang="en">
<head>
  <meta charset="utf-8">
  <meta name="viewport" content="width=device-width, initial-scale=1">
  <title>TaskTracker - Add task</title>
</head>
<body>
  <h1>Add task</h1>
  <form method="post" action="/">
    <p>
      <label for="task_name">Name</label>
      <input type="text" id="task_name" name="task_name" required>
    </p>
    <p>
      <label for="task_start">Start date</label>
      <input type="date" id="task_start" name="task_start" required>
    </p>
    <p>
      <label for="task_time">Start time</label>
      <input type="time" id="task_time" name="task_time" required>
    </p>
    <p>
      <label for="repeat_info">Repeat</label>
      <select id="repeat_info" name="repeat_info">
        <option value="once">Once</option>
        <option value="daily">Daily</option>
        <option value="weekdays">Weekdays</option>
        <option value="weekly">Weekly</option>
        <option value="biweekly">Every two weeks</option>
        <option value="four_weeks">Every four weeks</option>
        <option value="monthly">Monthly</option>
      </select>
    </p>
    <p><button type="submit">Add</button></p>
  </form>
</body>
</html>
)HTML";
    return page;
}

} // namespace tasktracker::ui
