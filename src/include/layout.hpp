#ifndef ARBOR_LAYOUT_HPP
#define ARBOR_LAYOUT_HPP

#include "common.hpp"

// Outer HTML document every page render starts from; "head" and "body"
// default to empty and are overridden by fragment files along the path.
inline constexpr const char *LAYOUT_TEMPLATE_NAME = "layout";
inline constexpr std::string_view LAYOUT_TEMPLATE = R"({{define "head"}}{{end}}
{{- define "body"}}{{end -}}
<!DOCTYPE html>
<html>
	<head>
		{{template "head" .}}
	</head>

	<body>
		{{template "body" .}}
	</body>
</html>)";

// Renders the body alone, used to answer HTMX partial requests
inline constexpr const char *FRAGMENT_TEMPLATE_NAME = "fragment";
inline constexpr std::string_view FRAGMENT_TEMPLATE = R"({{define "body"}}{{end}}{{template "body" .}})";

#endif // ARBOR_LAYOUT_HPP
