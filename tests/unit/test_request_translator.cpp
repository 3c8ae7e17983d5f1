#include <catch2/catch.hpp>

#include "gateway/errors.h"
#include "gateway/model_catalog.h"
#include "gateway/request_translator.h"

#include <stdexcept>

using vertexbridge::ChatMessage;
using vertexbridge::Role;

namespace {

vertexbridge::TrimmedContext Context(std::vector<ChatMessage> messages) {
  vertexbridge::TrimmedContext ctx;
  ctx.messages = std::move(messages);
  return ctx;
}

} // namespace

TEST_CASE("ModelCatalog keeps order, drops duplicates and blanks",
          "[catalog]") {
  vertexbridge::ModelCatalog catalog({"a", "b", "a", "", "c"});
  REQUIRE(catalog.DefaultModel() == "a");
  REQUIRE(catalog.Ids() == std::vector<std::string>{"a", "b", "c"});
  REQUIRE(catalog.Supports("b"));
  REQUIRE_FALSE(catalog.Supports("z"));
  REQUIRE_THROWS_AS(vertexbridge::ModelCatalog(std::vector<std::string>{}),
                    std::invalid_argument);
}

TEST_CASE("RequestTranslator maps roles onto backend contents",
          "[translator]") {
  vertexbridge::ModelCatalog catalog({"gemini-test"});
  vertexbridge::RequestTranslator translator(catalog);

  auto request = translator.Translate(
      Context({{Role::kSystem, "Be brief"},
               {Role::kUser, "Hi"},
               {Role::kAssistant, "Hello"},
               {Role::kSystem, "Answer in French"},
               {Role::kUser, "How are you?"}}),
      "gemini-test", 0.7, 256);

  REQUIRE(request.model == "gemini-test");
  REQUIRE(request.system_instruction == std::string("Be brief"));
  REQUIRE(request.contents.size() == 4);
  REQUIRE(request.contents[0].role == "user");
  REQUIRE(request.contents[1].role == "model");
  REQUIRE(request.contents[1].text == "Hello");
  REQUIRE(request.contents[2].role == "user");
  REQUIRE(request.contents[2].text == "Answer in French");
  REQUIRE(request.temperature == 0.7);
  REQUIRE(request.max_output_tokens == 256);
  REQUIRE_FALSE(request.top_p.has_value());
}

TEST_CASE("RequestTranslator sends a lone system message as a user turn",
          "[translator]") {
  vertexbridge::ModelCatalog catalog({"gemini-test"});
  vertexbridge::RequestTranslator translator(catalog);

  auto request = translator.Translate(Context({{Role::kSystem, "Only me"}}),
                                      "gemini-test", {}, {});

  REQUIRE_FALSE(request.system_instruction.has_value());
  REQUIRE(request.contents.size() == 1);
  REQUIRE(request.contents[0].role == "user");
  REQUIRE(request.contents[0].text == "Only me");
}

TEST_CASE("RequestTranslator carries top_p and stop from the request",
          "[translator]") {
  vertexbridge::ModelCatalog catalog({"gemini-test"});
  vertexbridge::RequestTranslator translator(catalog);
  vertexbridge::ChatRequest chat;
  chat.model = "gemini-test";
  chat.messages = {{Role::kUser, "Hi"}};
  chat.top_p = 0.5;
  chat.stop = {"END"};

  auto request = translator.Translate(Context(chat.messages), chat);

  REQUIRE(request.top_p == 0.5);
  REQUIRE(request.stop_sequences == std::vector<std::string>{"END"});
  REQUIRE_FALSE(request.temperature.has_value());
}

TEST_CASE("RequestTranslator rejects models outside the catalog",
          "[translator]") {
  vertexbridge::ModelCatalog catalog({"gemini-test"});
  vertexbridge::RequestTranslator translator(catalog);

  try {
    translator.Translate(Context({{Role::kUser, "Hi"}}), "gpt-4", {}, {});
    FAIL("expected InvalidModel");
  } catch (const vertexbridge::GatewayError &ex) {
    REQUIRE(ex.kind() == vertexbridge::ErrorKind::kInvalidModel);
    REQUIRE(ex.param() == "model");
    REQUIRE(std::string(ex.what()) == "Model 'gpt-4' not found");
  }
}
