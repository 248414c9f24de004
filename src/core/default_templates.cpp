#include "default_templates.hpp"

static const char *default_page = R"(<!DOCTYPE html>
<html lang="en">
<head>
  <meta charset="utf-8">
  <meta name="viewport" content="width=device-width, initial-scale=1">
  <title>{% if exists("title") %}{{ title }}{% else %}Untitled{% endif %}</title>
  {% if exists("description") %}<meta name="description" content="{{ description }}">{% endif %}
  <link rel="stylesheet" href="/style.css">
</head>
<body>
<main>
{{ body }}
</main>
</body>
</html>
)";

static const char *default_style = R"(body {
  margin: 0 auto;
  max-width: 46rem;
  padding: 1rem 1.5rem;
  font-family: Georgia, "Times New Roman", serif;
  line-height: 1.6;
  color: #222;
}

pre, code {
  font-family: Menlo, Consolas, monospace;
  font-size: 0.9em;
}

pre {
  overflow-x: auto;
  padding: 0.75rem;
  background: #f4f4f4;
}

img {
  max-width: 100%;
}

audio {
  display: block;
  margin: 0.5rem 0;
}

a.audio {
  text-decoration: none;
}
)";

std::vector<EmbeddedFile> default_templates(const std::string &template_ext) {
  return {
      {"default." + template_ext, default_page},
      {"style.css", default_style},
  };
}
