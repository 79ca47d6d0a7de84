#include "stdinc.hpp"

#include "method-docs.hpp"

#include <iterator>

namespace jsonactor::rpc {

namespace {
  string param_list(const MethodInfo& method) {
    if (method.params.empty())
      return "None";
    const auto parts = method.params | views::transform([](const ParamInfo& p) {
                         return format("`{}`: `{}`", p.name, p.type);
                       })
                       | ranges::to<vector<string>>();
    return format("{}", fmt::join(parts, ", "));
  }

  // One `"name": value` line per parameter, at `indent`
  void write_object_body(std::back_insert_iterator<string> out, const MethodInfo& method,
                         string_view indent) {
    for (std::size_t i = 0; i < method.params.size(); ++i) {
      const auto& param = method.params[i];
      const auto comma = (i + 1 == method.params.size()) ? "" : ",";
      fmt::format_to(out, "{}\"{}\": {}{}\n", indent, param.name, param.example, comma);
    }
  }
} // namespace

string describe_methods(const vector<MethodInfo>& methods, string_view title,
                        string_view base_url) {
  string doc;
  auto out = std::back_inserter(doc);

  fmt::format_to(out, "# {}\n\n", title);
  doc += "Methods are called with a JSON object of named parameters, either as the body "
         "of `POST /<method>`, or as the `params` of a websocket message.\n\n";

  doc += "| Method | Parameters | Return Type |\n";
  doc += "|--------|------------|-------------|\n";
  for (const auto& method : methods)
    fmt::format_to(out, "| `{}` | {} | `{}` |\n", method.name, param_list(method),
                   method.result_type);
  doc += "\n";

  for (const auto& method : methods) {
    doc += "---\n";
    fmt::format_to(out, "## Method `{}`\n\n", method.name);
    if (!method.doc.empty())
      fmt::format_to(out, "{}\n\n", method.doc);

    if (method.params.empty()) {
      doc += "- **Parameters:** None\n";
    } else {
      doc += "- **Parameters:**\n";
      for (const auto& param : method.params)
        fmt::format_to(out, "  - `{}`: `{}`\n", param.name, param.type);
    }
    fmt::format_to(out, "- **Returns:** `{}`\n\n", method.result_type);

    doc += "**HTTP Body:**\n```json\n";
    if (method.params.empty()) {
      doc += "{}\n";
    } else {
      doc += "{\n";
      write_object_body(out, method, "  ");
      doc += "}\n";
    }
    doc += "```\n\n";

    doc += "**WebSocket Message:**\n```json\n";
    fmt::format_to(out, "{{\n  \"method\": \"{}\",\n  \"params\": ", method.name);
    if (method.params.empty()) {
      doc += "{}\n";
    } else {
      doc += "{\n";
      write_object_body(out, method, "    ");
      doc += "  }\n";
    }
    doc += "}\n```\n\n";

    doc += "**Javascript:**\n```js\n";
    fmt::format_to(out, "result = await fetch(\"{}/{}\", {{\n", base_url, method.name);
    doc += "  method: 'POST',\n";
    doc += "  headers: { 'Content-Type': 'application/json' },\n";
    if (method.params.empty()) {
      doc += "  body: JSON.stringify({})\n";
    } else {
      doc += "  body: JSON.stringify({\n";
      write_object_body(out, method, "    ");
      doc += "  })\n";
    }
    doc += "});\n```\n\n";
  }

  return doc;
}

} // namespace jsonactor::rpc
