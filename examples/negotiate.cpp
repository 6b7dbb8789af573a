#include <conneg/conneg.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace conneg;

namespace {

struct TodoInput {
  std::string title;
};

struct Todo {
  int id;
  std::string title;
  bool done;
};

std::vector<Todo> todos{{1, "write docs", false}, {2, "review", true}};

void Print(std::string_view what, const HttpResponse &resp) {
  std::cout << "== " << what << "\n" << resp.status() << ' ' << resp.reason() << '\n';
  for (const auto &field : resp.headers()) {
    std::cout << field.name << ": " << field.value << '\n';
  }
  std::cout << "body (" << resp.body().size() << " bytes)";
  if (resp.headerValueOrEmpty(http::ContentType) != http::ContentTypeApplicationCbor) {
    std::cout << ": " << resp.body();
  }
  std::cout << "\n\n";
}

}  // namespace

template <>
struct glz::meta<TodoInput> {
  using T = TodoInput;
  static constexpr auto value = glz::object("title", &T::title);
};

template <>
struct glz::meta<Todo> {
  using T = Todo;
  static constexpr auto value = glz::object("id", &T::id, "title", &T::title, "done", &T::done);
};

// Simulates a few exchanges through a negotiation stage, as a transport would after parsing requests.
int main() {
  log::set_level(log::level::debug);

  try {
    MediaTypeRegistry registry(NegotiationConfig{}.withFormat(MediaType::beve));
    NegotiationStage stage(registry,
                           [](ExchangeState state) { log::debug("exchange state: {}", GetExchangeStateStr(state)); });

    RequestHandler listTodos = [](HttpRequest &) { return Negotiate(todos).intoResponse(); };

    RequestHandler createTodo = stage.withDecodedBody<TodoInput>([](HttpRequest &, TodoInput input) {
      Todo &todo = todos.emplace_back(static_cast<int>(todos.size()) + 1, std::move(input.title), false);
      return Negotiate(todo).intoResponse(http::StatusCodeCreated);
    });

    AsyncRequestHandler firstTodo = [](HttpRequest &) -> RequestTask<HttpResponse> {
      if (todos.empty()) {
        co_return HttpResponse(http::StatusCodeNotFound);
      }
      co_return Negotiate(todos.front()).intoResponse();
    };

    HttpRequest listJson("/todos");
    listJson.addHeader(http::Accept, "application/json");
    Print("GET /todos (json)", stage.handle(listJson, listTodos));

    HttpRequest listCbor("/todos");
    listCbor.addHeader(http::Accept, "application/json;q=0.5, application/cbor");
    Print("GET /todos (cbor preferred)", stage.handle(listCbor, listTodos));

    HttpRequest create("/todos");
    create.addHeader(http::ContentType, http::ContentTypeApplicationJson).body(R"({"title":"ship it"})");
    Print("POST /todos", stage.handle(create, createTodo));

    HttpRequest malformed("/todos");
    malformed.addHeader(http::ContentType, http::ContentTypeApplicationJson).body(R"({"title":)");
    Print("POST /todos (malformed)", stage.handle(malformed, createTodo));

    HttpRequest notAcceptable("/todos");
    notAcceptable.addHeader(http::Accept, "text/html");
    Print("GET /todos (html)", stage.handle(notAcceptable, listTodos));

    HttpRequest first("/todos/first");
    auto task = stage.handleAsync(first, firstTodo);
    Print("GET /todos/first (async)", task.runSynchronously());
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
