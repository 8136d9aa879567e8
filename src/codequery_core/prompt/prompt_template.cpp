#include "codequery_core/prompt/prompt_template.hpp"

namespace codequery_core {

namespace {

constexpr const char *PREAMBLE =
    "You are a helpful code assistant. Answer the user's question based on the provided code "
    "context.\n\nContext from the codebase:\n";

constexpr const char *INSTRUCTIONS =
    "\n\nInstructions:\n"
    "- Answer based on the provided code context\n"
    "- Be specific and reference file names when relevant\n"
    "- If the context doesn't contain enough information, say so\n"
    "- Provide code examples if helpful\n"
    "- Be concise but thorough\n"
    "- If asked to summarise what the project does,explain what the project does,you do not "
    "need to cite code examples for that\n\n"
    "Answer:";

}  // namespace

std::string PromptTemplate::scaffold(const std::string &query) {
  return assemble("", query);
}

std::string PromptTemplate::render_chunk(std::size_t position, const std::string &filepath,
                                         const std::string &content) {
  return "\n--- Code Snippet " + std::to_string(position) + " from " + filepath + " ---\n" +
         content + "\n";
}

std::string PromptTemplate::render_context(const std::vector<Chunk> &chunks) {
  std::string context;
  for (std::size_t i = 0; i < chunks.size(); ++i) {
    context += render_chunk(i + 1, chunks[i].filepath, chunks[i].content);
  }
  return context;
}

std::string PromptTemplate::render_prompt(const std::string &query,
                                          const std::vector<Chunk> &chunks) {
  return assemble(render_context(chunks), query);
}

std::string PromptTemplate::assemble(const std::string &context, const std::string &query) {
  return std::string(PREAMBLE) + context + "\n\nUser Question: " + query + INSTRUCTIONS;
}

}  // namespace codequery_core
