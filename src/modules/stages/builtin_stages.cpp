// modules/stages/builtin_stages.cpp
#include "modules/stages/stage_library.h"

namespace researchflow {

const std::string& builtin_stage_markdown() {
    static const std::string markdown = R"MD(
# Research pipeline stages

## Planning

### ResearchFlow `/planning/__meta__`
```yaml
# --- BEGIN ResearchFlow ---
budget:
  max_steps: 8
  max_external_calls: 2
# --- END ResearchFlow ---
```

### ResearchFlow `/planning/analyze_topic`
```yaml
# --- BEGIN ResearchFlow ---
type: generate_text
output_keys: analysis
prompt_template: |
  Analyze this research topic and provide initial insights: {{ topic }}

  Consider:
  - What are the main aspects to research?
  - What methodology would be most appropriate?
  - What are the key areas that need coverage?

  Provide a structured analysis of the research scope and approach.
# --- END ResearchFlow ---
```

### ResearchFlow `/planning/create_plan`
```yaml
# --- BEGIN ResearchFlow ---
type: generate_text
output_keys: plan_text
metadata:
  temperature: 0.2
prompt_template: |
  Based on this topic analysis:
  {{ analysis }}

  Create a detailed research plan for: {{ topic }}

  Requirements:
  - Exactly {{ section_count }} sections
  - Each section should focus on a specific, distinct aspect
  - Sections should be comprehensive and non-overlapping
  - Include appropriate research methodology

  Answer with a single JSON object of the form
  {"methodology": "...", "sections": [{"title": "...", "questions": ["..."]}]}
# --- END ResearchFlow ---
```

### ResearchFlow `/planning/select_plan_parser`
```yaml
# --- BEGIN ResearchFlow ---
type: route
route: planning.select_parser
branches:
  - /planning/parse_json_plan
  - /planning/parse_line_plan
# --- END ResearchFlow ---
```

### ResearchFlow `/planning/parse_json_plan`
```yaml
# --- BEGIN ResearchFlow ---
type: transform
transform: planning.parse_json_plan
output_keys: plan
next: /end
# --- END ResearchFlow ---
```

### ResearchFlow `/planning/parse_line_plan`
```yaml
# --- BEGIN ResearchFlow ---
type: transform
transform: planning.parse_line_plan
output_keys: plan
# --- END ResearchFlow ---
```

## Research (one instance per section)

### ResearchFlow `/research/__meta__`
```yaml
# --- BEGIN ResearchFlow ---
budget:
  max_steps: 8
  max_external_calls: 24
# --- END ResearchFlow ---
```

### ResearchFlow `/research/generate_queries`
```yaml
# --- BEGIN ResearchFlow ---
type: generate_text
output_keys: query_text
prompt_template: |
  Generate {{ search_depth }} specific, diverse search queries for researching this section:

  Section: {{ section_title }}
  Main Topic: {{ topic }}
  {% if length(guiding_questions) > 0 %}
  Guiding questions:
  {% for q in guiding_questions %}
  - {{ q }}
  {% endfor %}
  {% endif %}

  Requirements:
  - Queries should be specific and focused
  - Cover different aspects of the section
  - Use varied terminology and approaches

  Return only the queries, one per line, without numbers or bullets.
# --- END ResearchFlow ---
```

### ResearchFlow `/research/split_queries`
```yaml
# --- BEGIN ResearchFlow ---
type: transform
transform: research.split_queries
output_keys: queries
# --- END ResearchFlow ---
```

### ResearchFlow `/research/conduct_searches`
```yaml
# --- BEGIN ResearchFlow ---
type: web_search
queries_key: queries
max_results: "{{ search_depth }}"
output_keys: search_results
# --- END ResearchFlow ---
```

### ResearchFlow `/research/select_synthesis`
```yaml
# --- BEGIN ResearchFlow ---
type: route
route: research.select_synthesis
branches:
  - /research/synthesize_content
  - /research/synthesize_without_sources
# --- END ResearchFlow ---
```

### ResearchFlow `/research/synthesize_content`
```yaml
# --- BEGIN ResearchFlow ---
type: generate_text
output_keys: section_content
next: /research/extract_sources
prompt_template: |
  Create a comprehensive, well-researched section based on the search results below.

  Section Title: {{ section_title }}
  Main Topic: {{ topic }}

  SEARCH RESULTS:
  {% for r in search_results %}
  Query: {{ r.query }}
  Source: {{ r.url }}
  Content: {{ truncate(r.snippet, 1500) }}

  {% endfor %}
  REQUIREMENTS:
  - Write a detailed, informative section (800-1200 words)
  - Include specific facts, statistics, and findings from the search results
  - Use clear subsections and markdown formatting
  - Cite specific information where possible
# --- END ResearchFlow ---
```

### ResearchFlow `/research/synthesize_without_sources`
```yaml
# --- BEGIN ResearchFlow ---
type: generate_text
output_keys: section_content
prompt_template: |
  The web search returned no results for this section.
  Write a careful overview of the section from general knowledge and state
  clearly that no external sources were found.

  Section Title: {{ section_title }}
  Main Topic: {{ topic }}
# --- END ResearchFlow ---
```

### ResearchFlow `/research/extract_sources`
```yaml
# --- BEGIN ResearchFlow ---
type: transform
transform: research.extract_sources
output_keys: sources
# --- END ResearchFlow ---
```

## Report

### ResearchFlow `/report/__meta__`
```yaml
# --- BEGIN ResearchFlow ---
budget:
  max_steps: 8
  max_external_calls: 2
# --- END ResearchFlow ---
```

### ResearchFlow `/report/create_executive_summary`
```yaml
# --- BEGIN ResearchFlow ---
type: generate_text
output_keys: executive_summary
prompt_template: |
  Create a comprehensive executive summary for this research report:

  Topic: {{ topic }}
  Number of sections: {{ length(sections) }}

  SECTION CONTENT PREVIEWS:
  {% for s in sections %}
  **{{ s.title }}**: {{ truncate(s.content, 300) }}

  {% endfor %}
  Create an executive summary that captures the key findings across all
  sections and gives a clear overview of the research scope (300-500 words).
# --- END ResearchFlow ---
```

### ResearchFlow `/report/compile_body`
```yaml
# --- BEGIN ResearchFlow ---
type: transform
transform: report.compile_body
output_keys: body
# --- END ResearchFlow ---
```

### ResearchFlow `/report/create_conclusion`
```yaml
# --- BEGIN ResearchFlow ---
type: generate_text
output_keys: conclusion
prompt_template: |
  Create a comprehensive conclusion for this research report:
  Topic: {{ topic }}

  KEY FINDINGS FROM SECTIONS:
  {% for s in sections %}
  - {{ s.title }}: {{ truncate(s.content, 200) }}
  {% endfor %}

  Synthesize findings across all research areas, discuss implications and
  suggest areas for future research (400-600 words).
# --- END ResearchFlow ---
```

### ResearchFlow `/report/compile_sources`
```yaml
# --- BEGIN ResearchFlow ---
type: transform
transform: report.compile_sources
output_keys: [sources, sources_section, total_queries]
# --- END ResearchFlow ---
```

### ResearchFlow `/report/finalize_report`
```yaml
# --- BEGIN ResearchFlow ---
type: transform
transform: report.finalize
output_keys: [final_report, report_metadata]
# --- END ResearchFlow ---
```
)MD";
    return markdown;
}

} // namespace researchflow
