#include "omnibox.hpp"
#include "scheduler.hpp"
#include "suggestion_source.hpp"
#include "term_widgets.hpp"
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

using namespace std::chrono_literals;

class EchoSource : public SuggestionSource {
public:
  std::vector<Suggestion> query(const std::string& text, size_t max_results) override {
    {
      std::lock_guard<std::mutex> lk(mu_);
      queries_.push_back(text);
    }
    std::vector<Suggestion> out;
    for (int i = 0; i < 3; ++i) {
      out.push_back(Suggestion{text + std::to_string(i), "/docs/" + text + std::to_string(i), 10 - i});
    }
    (void)max_results;
    return out;
  }
  std::vector<std::string> queries() {
    std::lock_guard<std::mutex> lk(mu_);
    return queries_;
  }
private:
  std::mutex mu_;
  std::vector<std::string> queries_;
};

struct Fixture {
  Fixture() : loop(clock) {
    OmniboxOptions opts;
    opts.debounce = 50ms;
    opts.max_results = 2;
    box = std::make_shared<Omnibox>(f, loop, worker, source, opts);
  }
  void settle() {
    clock.advance(50ms);
    loop.run_pending();
    worker.wait_idle();
    loop.run_pending();
  }
  TermWidgetFactory f;
  ManualClock clock;
  MainLoop loop;
  BackgroundWorker worker;
  std::shared_ptr<EchoSource> source = std::make_shared<EchoSource>();
  std::shared_ptr<Omnibox> box;
};

static void test_show_hide() {
  Fixture fx;
  assert(!fx.box->is_visible());
  assert(!fx.box->widget()->is_visible());
  fx.box->show("");
  assert(fx.box->is_visible());
  assert(fx.box->widget()->is_visible());
  assert(fx.loop.timer_count() == 0);
  auto v = fx.box->version();
  fx.box->hide();
  assert(!fx.box->is_visible());
  assert(fx.box->version() != v);
  fx.box->toggle();
  assert(fx.box->is_visible());
  fx.box->toggle();
  assert(!fx.box->is_visible());
}

static void test_debounced_search() {
  Fixture fx;
  fx.box->show("");
  fx.box->append_char('a');
  fx.box->append_char('b');
  assert(fx.box->query() == "ab");
  fx.clock.advance(30ms);
  fx.loop.run_pending();
  assert(fx.source->queries().empty());
  fx.settle();
  assert((fx.source->queries() == std::vector<std::string>{"ab"}));
  assert(!fx.box->is_searching());
  assert(fx.box->results().size() == 2);
  assert(fx.box->results()[0].uri == "/docs/ab0");

  // the same query is not searched twice
  fx.box->append_char('x');
  fx.box->backspace();
  fx.settle();
  assert(fx.source->queries().size() == 1);

  fx.box->backspace();
  fx.box->backspace();
  assert(fx.box->results().empty());
  assert(fx.loop.timer_count() == 0);
}

static void test_stale_results_are_dropped() {
  Fixture fx;
  fx.box->show("ab");
  fx.clock.advance(50ms);
  fx.loop.run_pending();
  assert(fx.box->is_searching());
  // the query changes while the search is in flight
  fx.box->append_char('c');
  fx.worker.wait_idle();
  fx.loop.run_pending();
  assert(fx.box->results().empty());

  fx.settle();
  assert(fx.box->results().size() == 2);
  assert(fx.box->results()[0].title == "abc0");
  assert(!fx.box->is_searching());

  // results arriving after hide are ignored too
  fx.box->append_char('d');
  fx.clock.advance(50ms);
  fx.loop.run_pending();
  fx.box->hide();
  fx.worker.wait_idle();
  fx.loop.run_pending();
  assert(fx.box->results()[0].title == "abc0");
}

static void test_destroyed_before_results() {
  Fixture fx;
  fx.box->show("q");
  fx.clock.advance(50ms);
  fx.loop.run_pending();
  fx.box.reset();
  fx.worker.wait_idle();
  assert(fx.loop.run_pending() == 1);
}

static void test_selection_and_activate() {
  Fixture fx;
  std::vector<std::string> targets;
  fx.box->set_on_navigate([&](const std::string& t){ targets.push_back(t); });
  fx.box->show("");
  assert(!fx.box->activate());

  fx.box->set_query("doc");
  fx.settle();
  assert(fx.box->selected_index() == -1);
  fx.box->select_next();
  fx.box->select_next();
  assert(fx.box->selected_index() == 1);
  fx.box->select_next();
  assert(fx.box->selected_index() == 0);
  fx.box->select_previous();
  assert(fx.box->selected_index() == 1);
  assert(fx.box->activate());
  assert((targets == std::vector<std::string>{"/docs/doc1"}));
  assert(!fx.box->is_visible());

  // a typed location wins over the selection
  fx.box->show("");
  fx.box->set_query("./notes.txt");
  fx.settle();
  fx.box->select_next();
  assert(fx.box->activate());
  assert(targets.back() == "./notes.txt");
}

static void test_looks_like_location() {
  assert(looks_like_location("/etc/hosts"));
  assert(looks_like_location("~/notes"));
  assert(looks_like_location("./a"));
  assert(looks_like_location("src/main.cpp"));
  assert(looks_like_location("file:///tmp/x"));
  assert(!looks_like_location("readme"));
  assert(!looks_like_location(""));
}

static void test_fuzzy_score() {
  assert(fuzzy_score("", "anything") == 1);
  assert(fuzzy_score("xyz", "main.cpp") == 0);
  int prefix = fuzzy_score("mai", "main.cpp");
  int inner = fuzzy_score("ain", "main.cpp");
  int subseq = fuzzy_score("mcp", "main.cpp");
  assert(prefix > inner);
  assert(inner > subseq);
  assert(subseq > 0);
  assert(fuzzy_score("MAIN", "main.cpp") == fuzzy_score("main", "main.cpp"));
}

static void test_path_source() {
  auto dir = std::filesystem::temp_directory_path() / "mtile_omnibox_test";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir / "sub");
  std::ofstream(dir / "alpha.txt") << "a\n";
  std::ofstream(dir / "beta.txt") << "b\n";
  std::ofstream(dir / "sub" / "alpine.md") << "c\n";

  PathSuggestionSource src(dir, 2);
  auto hits = src.query("alp", 10);
  assert(!hits.empty());
  assert(hits[0].title == "alpha.txt");
  for (const auto& h : hits) assert(h.title != "beta.txt");

  auto nested = src.query("sub/alp", 10);
  assert(!nested.empty());
  assert(nested[0].title == "alpine.md");

  src.add_recent("/elsewhere/alpaca.txt");
  src.add_recent("/elsewhere/one");
  src.add_recent("/elsewhere/two");
  assert(src.recent().size() == 2);
  src.add_recent("/elsewhere/one");
  assert(src.recent().size() == 2);
  assert(src.recent().front() == "/elsewhere/one");
  src.add_recent("");
  assert(src.recent().size() == 2);

  auto limited = src.query("t", 1);
  assert(limited.size() == 1);
  std::filesystem::remove_all(dir);
}

int main() {
  test_show_hide();
  test_debounced_search();
  test_stale_results_are_dropped();
  test_destroyed_before_results();
  test_selection_and_activate();
  test_looks_like_location();
  test_fuzzy_score();
  test_path_source();
  return 0;
}
