#include "passage_core/services/answer_service.hpp"

#include <iostream>

namespace passage_core {

namespace {

size_t trimmed_length(const std::string &text) {
  const auto first = text.find_first_not_of(" \t\n\r\f\v");
  if (first == std::string::npos) {
    return 0;
  }
  const auto last = text.find_last_not_of(" \t\n\r\f\v");
  return last - first + 1;
}

bool is_blank(const std::string &text) {
  return trimmed_length(text) == 0;
}

}  // namespace

AnswerService::AnswerService(std::shared_ptr<OllamaClient> ollama_client)
    : ollama_client_(std::move(ollama_client)) {}

std::string AnswerService::build_prompt(const std::string &query, const std::string &context) {
  return "You are an assistant that answers questions about a collection of documents.\n\n"
         "Instructions:\n"
         "1. Answer primarily from the document excerpts below.\n"
         "2. Cite the source and page of each excerpt you rely on.\n"
         "3. If the excerpts do not contain enough information, say so clearly before adding "
         "anything from general knowledge.\n\n"
         "Document excerpts:\n" +
         context + "\n\nQuestion:\n" + query + "\n\nAnswer:";
}

std::string AnswerService::fallback_answer(const std::string &query, const std::string &context) {
  return "Based on the available documents:\n\n" + context +
         "\n\n---\n\nRegarding your question: \"" + query +
         "\"\n\nThe passages above are the most relevant to your question. Review the cited "
         "sources and pages for details.\n\nNote: this response is based on document retrieval "
         "only. Configure a generation model for a generated answer.\n";
}

std::string AnswerService::setup_instructions() {
  return "No documents are indexed and no generation model is configured.\n\n"
         "To set up the system:\n"
         "- Add PDF, text or Markdown files to the documents directory\n"
         "- Run ingestion (passage_api --ingest, or passage_cli ingest)\n"
         "- Or set generation_model in passagerc.json\n";
}

std::string AnswerService::answer(const std::string &query, const std::string &context) {
  if (trimmed_length(context) < MIN_CONTEXT_CHARS) {
    return fallback_answer(query, NO_CONTEXT_MESSAGE);
  }
  if (!ollama_client_->has_generation_model()) {
    return fallback_answer(query, context);
  }

  try {
    std::string generated = ollama_client_->generate(build_prompt(query, context));
    if (is_blank(generated)) {
      std::cerr << "Warning: empty response from generation model, using fallback" << std::endl;
      return fallback_answer(query, context);
    }
    return generated;
  } catch (const OllamaError &e) {
    std::cerr << "Warning: generation failed, using fallback: " << e.what() << std::endl;
    return fallback_answer(query, context);
  }
}

std::string AnswerService::quick_answer(const std::string &query) {
  if (!ollama_client_->has_generation_model()) {
    return setup_instructions();
  }

  const std::string prompt =
      "You are an assistant that answers questions about documents. No documents are "
      "available for this question, so answer from general knowledge and say so.\n\n"
      "Question: " +
      query + "\n\nKeep the answer concise.";
  try {
    std::string generated = ollama_client_->generate(prompt);
    if (is_blank(generated)) {
      return "Unable to generate an answer. Please try again.";
    }
    return generated;
  } catch (const OllamaError &e) {
    return "Error generating answer: " + std::string(e.what()) +
           "\n\nCheck the Ollama server and generation model settings.";
  }
}

}  // namespace passage_core
