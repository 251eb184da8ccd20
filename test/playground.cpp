#include <iostream>
#include <courier/Combine.hpp>
#include <courier/Promise.hpp>
#include <courier/Scheduler.hpp>
#include <courier/web/BeastExchange.hpp>
#include <courier/web/Dispatcher.hpp>

namespace {

class KeysRenderer final : public courier::web::ViewRenderer {
public:
    std::string render(const std::string& view, const courier::web::Model& model) const override {
        std::string body = view;
        for(auto& [key, value] : model) {
            body += " " + key;
        }
        return body;
    }
};

} // namespace

int main(int, char **) {
    auto sched = courier::Scheduler::global();
    courier::web::Dispatcher dispatcher(sched);
    auto done = courier::Promise<bool>::create(sched);

    courier::web::BeastRequest request(boost::beast::http::verb::get, "/books?page=1", 11);
    auto exchange = std::make_shared<courier::web::BeastExchange>(
        request,
        std::make_shared<KeysRenderer>(),
        [](const std::any&) { return std::string("{}"); },
        [done](courier::web::BeastResponse&& response) {
            std::cout << response << std::endl;
            done->success(true);
        }
    );

    auto books = courier::Producer<std::vector<std::string>>::pure({"Dune", "Emma"})->asyncBoundary();
    auto count = courier::Producer<int64_t>::eval([] { return int64_t(2); })->asyncBoundary();

    dispatcher.dispatch(exchange, [books, count](auto&, auto& helper) {
        return helper.template renderWith<courier::CombinedResult<std::string>>(
            "index",
            courier::Combine::listAndCount<std::string>(books, count),
            [](auto& result) { return courier::Combine::toModel(result, "bookList", "bookCount"); }
        );
    });

    done->await();
    return 0;
}
