#include <iostream>
#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include "ide/command_bridge.hpp"
#include "ide/dispatcher.hpp"
#include "ide/state.hpp"
#include "ide/tools.hpp"

using revue::ide::CommandBridge;
using revue::ide::DiagnosticInfo;
using revue::ide::MethodDispatcher;
using revue::ide::OpenFileCommand;
using revue::ide::OpenFileInfo;
using revue::ide::ReviewStateSnapshot;
using revue::ide::Selection;
using revue::ide::SharedStateStore;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

struct Fixture {
  SharedStateStore state{};
  CommandBridge commands{4};
  MethodDispatcher dispatcher{revue::ide::build_tool_registry(state, commands)};
};

nlohmann::json request(const nlohmann::json& id, const std::string& method, const nlohmann::json& params) {
  nlohmann::json envelope{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}};
  if (!params.is_null()) {
    envelope["params"] = params;
  }
  return envelope;
}

// Sends one request and returns the decoded response envelope, or null when none was produced.
nlohmann::json exchange(const MethodDispatcher& dispatcher, const nlohmann::json& envelope) {
  auto reply = dispatcher.handle_text(envelope.dump());
  if (!reply.has_value()) {
    return nullptr;
  }
  return nlohmann::json::parse(*reply);
}

nlohmann::json call_tool(const MethodDispatcher& dispatcher, const std::string& name, const nlohmann::json& arguments) {
  return ::exchange(dispatcher, request(1, "tools/call", {{"name", name}, {"arguments", arguments}}));
}

nlohmann::json tool_payload(const nlohmann::json& response) {
  return nlohmann::json::parse(response["result"]["content"][0]["text"].get<std::string>());
}

ReviewStateSnapshot sample_snapshot() {
  ReviewStateSnapshot snapshot{};
  snapshot.set_workspace("/home/dev/project", std::nullopt);
  snapshot.open_files.push_back(OpenFileInfo{.file_path = "src/main.rs",
                                             .language_id = "rust",
                                             .is_dirty = true,
                                             .is_active = false,
                                             .status = "Modified",
                                             .reviewed = false});
  snapshot.open_files.push_back(OpenFileInfo{.file_path = "README.md",
                                             .language_id = "markdown",
                                             .is_dirty = false,
                                             .is_active = false,
                                             .status = "Added",
                                             .reviewed = true});
  snapshot.set_active_file(1);
  snapshot.diagnostics.push_back(DiagnosticInfo{.file_path = "src/main.rs",
                                                .start_line = 10,
                                                .end_line = 12,
                                                .message = "unchecked unwrap",
                                                .severity = "error",
                                                .comment_type = "Issue"});
  snapshot.diagnostics.push_back(DiagnosticInfo{.file_path = "README.md",
                                                .start_line = 1,
                                                .end_line = 1,
                                                .message = "nice intro",
                                                .severity = "hint",
                                                .comment_type = "Praise"});
  snapshot.diagnostics.push_back(DiagnosticInfo{.file_path = "src/lib.rs",
                                                .start_line = 3,
                                                .end_line = 3,
                                                .message = "odd tag",
                                                .severity = "critical",
                                                .comment_type = "Note"});
  return snapshot;
}

int test_unknown_method_is_method_not_found() {
  Fixture fixture;
  auto response = ::exchange(fixture.dispatcher, request(5, "resources/list", nullptr));
  if (response.is_null() || response["error"]["code"] != -32601 || response["id"] != 5) {
    return fail("test_unknown_method_is_method_not_found", "unknown method should return -32601");
  }
  if (response["error"]["message"] != "Method not found: resources/list") {
    return fail("test_unknown_method_is_method_not_found", "message should name the method");
  }
  return 0;
}

int test_notifications_never_get_responses() {
  Fixture fixture;
  const nlohmann::json initialized{{"jsonrpc", "2.0"}, {"method", "initialized"}};
  if (!::exchange(fixture.dispatcher, initialized).is_null()) {
    return fail("test_notifications_never_get_responses", "initialized must not be answered");
  }

  const nlohmann::json cancelled{{"jsonrpc", "2.0"}, {"method", "notifications/cancelled"}, {"params", {{"requestId", 3}}}};
  if (!::exchange(fixture.dispatcher, cancelled).is_null()) {
    return fail("test_notifications_never_get_responses", "notifications/cancelled must not be answered");
  }

  const nlohmann::json unknown{{"jsonrpc", "2.0"}, {"method", "does/not/exist"}};
  if (!::exchange(fixture.dispatcher, unknown).is_null()) {
    return fail("test_notifications_never_get_responses", "id-less unknown method must not be answered");
  }

  const nlohmann::json ping{{"jsonrpc", "2.0"}, {"method", "ping"}};
  if (!::exchange(fixture.dispatcher, ping).is_null()) {
    return fail("test_notifications_never_get_responses", "id-less ping must not be answered");
  }
  return 0;
}

int test_envelope_errors_are_answered() {
  Fixture fixture;
  auto reply = fixture.dispatcher.handle_text("{\"jsonrpc\": ");
  if (!reply.has_value()) {
    return fail("test_envelope_errors_are_answered", "parse error should be answered");
  }
  auto parsed = nlohmann::json::parse(*reply);
  if (parsed["error"]["code"] != -32700 || !parsed["id"].is_null()) {
    return fail("test_envelope_errors_are_answered", "parse error should carry a null id");
  }

  auto version = ::exchange(fixture.dispatcher, nlohmann::json{{"jsonrpc", "1.0"}, {"id", 4}, {"method", "ping"}});
  if (version["error"]["code"] != -32600 || version["id"] != 4) {
    return fail("test_envelope_errors_are_answered", "wrong version should be invalid request with the id");
  }
  return 0;
}

int test_initialize_and_ping() {
  Fixture fixture;
  auto response = ::exchange(
      fixture.dispatcher,
      request(1, "initialize",
              {{"protocolVersion", "2024-11-05"}, {"capabilities", nlohmann::json::object()}, {"clientInfo", {{"name", "test-client"}}}}));
  const auto& result = response["result"];
  if (result["protocolVersion"] != "2024-11-05" || result["serverInfo"]["name"] != "revue" ||
      !result["serverInfo"].contains("version") || !result["instructions"].is_string()) {
    return fail("test_initialize_and_ping", "initialize result malformed");
  }

  auto missing = ::exchange(fixture.dispatcher, request(2, "initialize", nullptr));
  if (missing["error"]["code"] != -32602) {
    return fail("test_initialize_and_ping", "initialize without params should be invalid params");
  }

  auto no_client = ::exchange(fixture.dispatcher,
                                  request(3, "initialize", {{"protocolVersion", "2024-11-05"}, {"capabilities", nlohmann::json::object()}}));
  if (no_client["error"]["code"] != -32602) {
    return fail("test_initialize_and_ping", "initialize without clientInfo should be invalid params");
  }

  auto ping = ::exchange(fixture.dispatcher, request("p", "ping", nullptr));
  if (!ping["result"].is_object() || !ping["result"].empty() || ping["id"] != "p") {
    return fail("test_initialize_and_ping", "ping should return an empty object");
  }
  return 0;
}

int test_tool_listing() {
  Fixture fixture;
  auto response = ::exchange(fixture.dispatcher, request(1, "tools/list", nullptr));
  const auto& tools = response["result"]["tools"];
  if (!tools.is_array() || tools.size() != 5U) {
    return fail("test_tool_listing", "exactly five tools should be listed");
  }

  for (const auto& tool : tools) {
    if (tool["description"].get<std::string>().empty() || tool["inputSchema"]["type"] != "object" ||
        !tool["inputSchema"]["properties"].is_object() || !tool["inputSchema"]["required"].is_array()) {
      return fail("test_tool_listing", "every tool needs a description and an object schema");
    }
    if (tool["name"] == "openFile" && tool["inputSchema"]["required"] != nlohmann::json::array({"filePath"})) {
      return fail("test_tool_listing", "openFile should require filePath");
    }
  }

  if (tools[0]["name"] != "getCurrentSelection" || tools[4]["name"] != "openFile") {
    return fail("test_tool_listing", "tools should be listed in registration order");
  }
  return 0;
}

int test_tools_call_param_validation() {
  Fixture fixture;
  if (::exchange(fixture.dispatcher, request(1, "tools/call", nullptr))["error"]["code"] != -32602) {
    return fail("test_tools_call_param_validation", "missing params should be invalid params");
  }
  if (::exchange(fixture.dispatcher, request(2, "tools/call", {{"arguments", nlohmann::json::object()}}))["error"]["code"] !=
      -32602) {
    return fail("test_tools_call_param_validation", "missing name should be invalid params");
  }
  if (::exchange(fixture.dispatcher, request(3, "tools/call", {{"name", "openFile"}, {"arguments", 7}}))["error"]["code"] !=
      -32602) {
    return fail("test_tools_call_param_validation", "non-object arguments should be invalid params");
  }

  auto unknown = call_tool(fixture.dispatcher, "deleteEverything", nlohmann::json::object());
  if (unknown.contains("error") || unknown["result"]["isError"] != true ||
      tool_payload(unknown)["error"] != "Unknown tool: deleteEverything") {
    return fail("test_tools_call_param_validation", "unknown tool should be a tool-level error");
  }
  return 0;
}

int test_open_file_emits_commands() {
  Fixture fixture;

  auto missing = call_tool(fixture.dispatcher, "openFile", nlohmann::json::object());
  if (missing.contains("error") || missing["result"]["isError"] != true) {
    return fail("test_open_file_emits_commands", "missing filePath should be a tool-level error");
  }
  auto missing_payload = tool_payload(missing);
  if (missing_payload["success"] != false ||
      missing_payload["error"].get<std::string>().find("Missing required parameter") == std::string::npos) {
    return fail("test_open_file_emits_commands", "missing filePath payload malformed");
  }

  auto no_line = call_tool(fixture.dispatcher, "openFile", {{"filePath", "src/main.rs"}});
  if (no_line["result"].contains("isError") || tool_payload(no_line)["success"] != true) {
    return fail("test_open_file_emits_commands", "openFile without line should succeed");
  }

  (void)call_tool(fixture.dispatcher, "openFile", {{"filePath", "src/lib.rs"}, {"line", 42}});

  auto batch = fixture.commands.drain(10);
  if (batch.size() != 2U) {
    return fail("test_open_file_emits_commands", "two commands should be queued");
  }
  const auto& first = std::get<OpenFileCommand>(batch[0]);
  const auto& second = std::get<OpenFileCommand>(batch[1]);
  if (first.path != "src/main.rs" || first.line.has_value()) {
    return fail("test_open_file_emits_commands", "first command should carry no line");
  }
  if (second.path != "src/lib.rs" || second.line != 42U) {
    return fail("test_open_file_emits_commands", "second command should carry line 42");
  }

  auto text_line = call_tool(fixture.dispatcher, "openFile", {{"filePath", "a"}, {"line", "ten"}});
  auto fractional_line = call_tool(fixture.dispatcher, "openFile", {{"filePath", "b"}, {"line", 4.2}});
  auto negative_line = call_tool(fixture.dispatcher, "openFile", {{"filePath", "c"}, {"line", -3}});
  if (text_line["result"].contains("isError") || fractional_line["result"].contains("isError") ||
      negative_line["result"].contains("isError")) {
    return fail("test_open_file_emits_commands", "unusable line should not fail the call");
  }
  auto lineless = fixture.commands.drain(10);
  if (lineless.size() != 3U) {
    return fail("test_open_file_emits_commands", "unusable line should still queue the command");
  }
  for (const auto& command : lineless) {
    if (std::get<OpenFileCommand>(command).line.has_value()) {
      return fail("test_open_file_emits_commands", "unusable line should be dropped from the command");
    }
  }
  return 0;
}

int test_open_file_reports_full_and_closed_queue() {
  Fixture fixture;
  for (int i = 0; i < 4; ++i) {
    (void)call_tool(fixture.dispatcher, "openFile", {{"filePath", "f" + std::to_string(i)}});
  }

  auto full = call_tool(fixture.dispatcher, "openFile", {{"filePath", "overflow"}});
  if (full["result"]["isError"] != true ||
      tool_payload(full)["error"].get<std::string>().find("Failed to send command") == std::string::npos) {
    return fail("test_open_file_reports_full_and_closed_queue", "full queue should be a tool-level error");
  }

  fixture.commands.close();
  auto closed = call_tool(fixture.dispatcher, "openFile", {{"filePath", "late"}});
  if (closed["result"]["isError"] != true) {
    return fail("test_open_file_reports_full_and_closed_queue", "closed bridge should be a tool-level error");
  }
  return 0;
}

int test_current_selection() {
  Fixture fixture;
  auto empty = call_tool(fixture.dispatcher, "getCurrentSelection", nlohmann::json::object());
  if (empty["result"].contains("isError") || tool_payload(empty)["error"] != "No selection") {
    return fail("test_current_selection", "empty selection should return the no-selection payload");
  }

  fixture.state.write()->selection = Selection{.file_path = "src/main.rs", .text = "let x = 1;", .start_line = 7, .end_line = 9};
  auto payload = tool_payload(call_tool(fixture.dispatcher, "getCurrentSelection", nlohmann::json::object()));
  if (payload["filePath"] != "src/main.rs" || payload["text"] != "let x = 1;" ||
      payload["selection"]["start"]["line"] != 7 || payload["selection"]["end"]["line"] != 9 ||
      payload["selection"]["start"]["character"] != 0) {
    return fail("test_current_selection", "selection payload malformed");
  }
  return 0;
}

int test_open_editors_and_workspace() {
  Fixture fixture;
  auto no_workspace = tool_payload(call_tool(fixture.dispatcher, "getWorkspaceFolders", nlohmann::json::object()));
  if (!no_workspace.is_array() || !no_workspace.empty()) {
    return fail("test_open_editors_and_workspace", "no workspace should give an empty array");
  }

  *fixture.state.write() = sample_snapshot();

  auto editors = tool_payload(call_tool(fixture.dispatcher, "getOpenEditors", nlohmann::json::object()));
  if (editors.size() != 2U || editors[0]["filePath"] != "src/main.rs" || editors[0]["languageId"] != "rust" ||
      editors[0]["isDirty"] != true || editors[0]["isActive"] != false || editors[1]["isActive"] != true) {
    return fail("test_open_editors_and_workspace", "open editors payload malformed");
  }

  auto folders = tool_payload(call_tool(fixture.dispatcher, "getWorkspaceFolders", nlohmann::json::object()));
  if (folders.size() != 1U || folders[0]["uri"] != "file:///home/dev/project" || folders[0]["name"] != "project") {
    return fail("test_open_editors_and_workspace", "workspace folder payload malformed");
  }

  fixture.state.write()->set_workspace("/srv/repo/", std::nullopt);
  auto trailing = tool_payload(call_tool(fixture.dispatcher, "getWorkspaceFolders", nlohmann::json::object()));
  if (trailing[0]["name"] != "repo") {
    return fail("test_open_editors_and_workspace", "trailing separator should still yield the last segment");
  }

  fixture.state.write()->set_workspace("/", std::nullopt);
  auto root = tool_payload(call_tool(fixture.dispatcher, "getWorkspaceFolders", nlohmann::json::object()));
  if (root[0]["name"] != "workspace") {
    return fail("test_open_editors_and_workspace", "root path should fall back to workspace");
  }
  return 0;
}

int test_invalid_utf8_stays_in_payload() {
  Fixture fixture;
  {
    auto state = fixture.state.write();
    state->open_files.push_back(OpenFileInfo{.file_path = "r\xe9sum\xe9.txt",
                                             .language_id = "plaintext",
                                             .is_dirty = true,
                                             .is_active = true,
                                             .status = "Modified",
                                             .reviewed = false});
    state->selection = Selection{.file_path = "notes.txt", .text = "caf\xe9", .start_line = 2, .end_line = 2};
  }

  auto editors_response = call_tool(fixture.dispatcher, "getOpenEditors", nlohmann::json::object());
  if (editors_response.contains("error") || editors_response["result"].contains("isError")) {
    return fail("test_invalid_utf8_stays_in_payload", "non UTF-8 path should not fail getOpenEditors");
  }
  auto editors = tool_payload(editors_response);
  const auto path = editors[0]["filePath"].get<std::string>();
  if (path.rfind("r", 0) != 0 || path.find("txt") == std::string::npos || path.find("\xef\xbf\xbd") == std::string::npos) {
    return fail("test_invalid_utf8_stays_in_payload", "invalid bytes should become replacement characters");
  }

  auto selection_response = call_tool(fixture.dispatcher, "getCurrentSelection", nlohmann::json::object());
  if (selection_response.contains("error") || selection_response["result"].contains("isError")) {
    return fail("test_invalid_utf8_stays_in_payload", "non UTF-8 selection should not fail getCurrentSelection");
  }
  if (tool_payload(selection_response)["text"].get<std::string>().rfind("caf", 0) != 0) {
    return fail("test_invalid_utf8_stays_in_payload", "selection text should keep its valid prefix");
  }
  return 0;
}

int test_diagnostics_filter_and_severity() {
  Fixture fixture;
  *fixture.state.write() = sample_snapshot();

  auto all = tool_payload(call_tool(fixture.dispatcher, "getDiagnostics", nlohmann::json::object()));
  if (all.size() != 3U) {
    return fail("test_diagnostics_filter_and_severity", "every diagnostic should be returned without a filter");
  }
  if (all[0]["severity"] != "error" || all[1]["severity"] != "hint" || all[2]["severity"] != "information") {
    return fail("test_diagnostics_filter_and_severity", "severity mapping mismatch");
  }
  if (all[0]["source"] != "revue" || all[0]["range"]["start"]["line"] != 10 || all[0]["range"]["end"]["line"] != 12) {
    return fail("test_diagnostics_filter_and_severity", "diagnostic range or source malformed");
  }

  auto filtered = tool_payload(call_tool(fixture.dispatcher, "getDiagnostics", {{"filePath", "README.md"}}));
  if (filtered.size() != 1U || filtered[0]["message"] != "nice intro") {
    return fail("test_diagnostics_filter_and_severity", "exact path filter should match one entry");
  }

  auto none = tool_payload(call_tool(fixture.dispatcher, "getDiagnostics", {{"filePath", "src"}}));
  if (!none.is_array() || !none.empty()) {
    return fail("test_diagnostics_filter_and_severity", "filter matching nothing should give an empty list");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_unknown_method_is_method_not_found(); rc != 0) return rc;
  if (int rc = test_notifications_never_get_responses(); rc != 0) return rc;
  if (int rc = test_envelope_errors_are_answered(); rc != 0) return rc;
  if (int rc = test_initialize_and_ping(); rc != 0) return rc;
  if (int rc = test_tool_listing(); rc != 0) return rc;
  if (int rc = test_tools_call_param_validation(); rc != 0) return rc;
  if (int rc = test_open_file_emits_commands(); rc != 0) return rc;
  if (int rc = test_open_file_reports_full_and_closed_queue(); rc != 0) return rc;
  if (int rc = test_current_selection(); rc != 0) return rc;
  if (int rc = test_open_editors_and_workspace(); rc != 0) return rc;
  if (int rc = test_invalid_utf8_stays_in_payload(); rc != 0) return rc;
  if (int rc = test_diagnostics_filter_and_severity(); rc != 0) return rc;

  std::cout << "[PASS] tools unit tests\n";
  return 0;
}
