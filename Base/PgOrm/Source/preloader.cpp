#include "pgorm/preloader.h"

#include <QDebug>
#include <algorithm>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <future>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>

#include "pgorm/value_codec.h"

namespace pgorm {

    namespace {
        struct HeadRequest {
            std::string head;
            std::vector<std::string> tails;
        };

        // "a", "a.b", "a.c.d" -> a: [b, c.d]; 保持第一次出现的顺序
        std::expected<std::vector<HeadRequest>, Error> groupByHead(const std::string &table, const std::vector<std::string> &names) {
            std::vector<HeadRequest> heads;
            for (const auto &name : names) {
                const auto dot = name.find('.');
                std::string head = name.substr(0, dot);
                std::string tail = dot == std::string::npos ? std::string() : name.substr(dot + 1);
                if (head.empty() || (dot != std::string::npos && tail.empty())) {
                    return std::unexpected(Error(ErrorCode::InvalidRelationship, "Malformed preload path '" + name + "' on table '" + table + "'."));
                }
                auto it = std::find_if(heads.begin(), heads.end(), [&](const HeadRequest &h) { return h.head == head; });
                if (it == heads.end()) {
                    heads.push_back({head, {}});
                    it = std::prev(heads.end());
                }
                if (!tail.empty() && std::find(it->tails.begin(), it->tails.end(), tail) == it->tails.end()) {
                    it->tails.push_back(std::move(tail));
                }
            }
            return heads;
        }
    }  // namespace

    RelationshipPreloader::RelationshipPreloader(IConnectionProvider &provider, const SchemaRegistry &registry, PreloadOptions options)
        : provider_(provider), registry_(registry), compiler_(&registry), options_(options) {
        if (options_.batch_size == 0) options_.batch_size = DEFAULT_BATCH_SIZE;
        if (options_.max_concurrency == 0) options_.max_concurrency = 1;
    }

    std::expected<std::vector<RelationshipPreloader::PreloadPlan>, Error> RelationshipPreloader::buildPlans(const std::string &table, const std::vector<std::string> &names) const {
        auto heads = groupByHead(table, names);
        if (!heads) return std::unexpected(heads.error());

        std::vector<PreloadPlan> plans;
        for (const auto &request : *heads) {
            auto rel = registry_.resolveRelationship(table, request.head);
            if (!rel) return std::unexpected(rel.error());
            const RelationshipInfo *info = *rel;
            if (info->type == AssociationType::ManyToMany) {
                return std::unexpected(Error(ErrorCode::NotImplemented, "Preloading manyToMany association '" + table + "." + info->name + "' is not supported."));
            }

            PreloadPlan plan;
            plan.name = info->name;
            plan.relationship = info;
            plan.related_meta = registry_.find(info->related_table);
            if (!request.tails.empty()) {
                auto children = buildPlans(info->related_table, request.tails);
                if (!children) return std::unexpected(children.error());
                plan.children = std::move(*children);
            }
            plans.push_back(std::move(plan));
        }
        return plans;
    }

    std::expected<RelationshipPreloader::AssociationIndex, Error> RelationshipPreloader::loadAssociation(Executor &executor, const PreloadPlan &plan, const std::vector<Row> &owners, const std::atomic<bool> &cancelled) const {
        const RelationshipInfo &rel = *plan.relationship;

        std::vector<SqlValue> keys;
        keys.reserve(owners.size());
        for (const auto &owner : owners) {
            const SqlValue *key = owner.find(rel.local_key);
            if (key && !key->isNull()) keys.push_back(*key);
        }
        AssociationIndex index;
        if (keys.empty()) return index;

        auto statements = compiler_.compileInLookup(rel.related_table, rel.foreign_key, keys, options_.batch_size);
        if (!statements) return std::unexpected(statements.error());

        std::vector<Row> related;
        for (const auto &statement : *statements) {
            if (cancelled.load()) {
                return std::unexpected(Error(ErrorCode::Cancelled, "Preload of '" + plan.name + "' cancelled after a sibling failure."));
            }
            auto batch = executor.query(statement, plan.related_meta);
            if (!batch) return std::unexpected(batch.error());
            related.insert(related.end(), std::make_move_iterator(batch->begin()), std::make_move_iterator(batch->end()));
        }

        if (!plan.children.empty() && !related.empty()) {
            auto enriched = loadSequential(executor, plan.children, std::move(related), cancelled);
            if (!enriched) return std::unexpected(enriched.error());
            related = std::move(*enriched);
        }

        for (auto &row : related) {
            auto key = sql_value_to_map_key(row.value(rel.foreign_key));
            if (!key) continue;
            index[*key].push_back(std::move(row));
        }
        return index;
    }

    std::vector<Row> RelationshipPreloader::attach(std::vector<Row> owners, const PreloadPlan &plan, const AssociationIndex &index) {
        const RelationshipInfo &rel = *plan.relationship;
        for (auto &owner : owners) {
            const std::vector<Row> *matches = nullptr;
            if (auto key = sql_value_to_map_key(owner.value(rel.local_key))) {
                auto it = index.find(*key);
                if (it != index.end()) matches = &it->second;
            }
            if (rel.isCollection()) {
                owner = owner.withMany(plan.name, matches ? *matches : std::vector<Row>{});
            } else {
                std::optional<Row> first;
                if (matches && !matches->empty()) first = matches->front();
                owner = owner.withOne(plan.name, std::move(first));
            }
        }
        return owners;
    }

    std::expected<std::vector<Row>, Error> RelationshipPreloader::loadSequential(Executor &executor, const std::vector<PreloadPlan> &plans, std::vector<Row> rows, const std::atomic<bool> &cancelled) const {
        std::vector<AssociationIndex> indexes;
        indexes.reserve(plans.size());
        for (const auto &plan : plans) {
            auto index = loadAssociation(executor, plan, rows, cancelled);
            if (!index) return std::unexpected(index.error());
            indexes.push_back(std::move(*index));
        }
        // 全部成功后才挂载
        for (size_t i = 0; i < plans.size(); ++i) {
            rows = attach(std::move(rows), plans[i], indexes[i]);
        }
        return rows;
    }

    std::expected<std::vector<RelationshipPreloader::AssociationIndex>, Error> RelationshipPreloader::loadConcurrent(const std::vector<PreloadPlan> &plans, const std::vector<Row> &rows) const {
        std::atomic<bool> cancelled{false};
        std::mutex error_mutex;
        std::optional<Error> first_error;

        auto fail = [&](const Error &err) {
            std::lock_guard<std::mutex> lock(error_mutex);
            // 被取消的任务不覆盖真正的失败原因
            if (!first_error || (first_error->code == ErrorCode::Cancelled && err.code != ErrorCode::Cancelled)) first_error = err;
            cancelled.store(true);
        };

        std::vector<std::future<std::optional<AssociationIndex>>> futures;
        futures.reserve(plans.size());
        {
            boost::asio::thread_pool workers(std::min(options_.max_concurrency, plans.size()));
            for (const auto &plan : plans) {
                auto task = std::make_shared<std::packaged_task<std::optional<AssociationIndex>()>>([this, &plan, &rows, &cancelled, &fail]() -> std::optional<AssociationIndex> {
                    if (cancelled.load()) {
                        fail(Error(ErrorCode::Cancelled, "Preload of '" + plan.name + "' cancelled after a sibling failure."));
                        return std::nullopt;
                    }
                    auto lease = provider_.acquire();
                    if (!lease) {
                        fail(lease.error());
                        return std::nullopt;
                    }
                    Executor executor(lease->database());
                    auto index = loadAssociation(executor, plan, rows, cancelled);
                    if (!index) {
                        fail(index.error());
                        return std::nullopt;
                    }
                    return std::move(*index);
                });
                futures.push_back(task->get_future());
                boost::asio::post(workers, [task]() { (*task)(); });
            }
            workers.join();
        }

        std::vector<AssociationIndex> indexes;
        indexes.reserve(plans.size());
        for (auto &future : futures) {
            auto result = future.get();
            if (result) indexes.push_back(std::move(*result));
        }
        if (first_error) {
            qWarning().noquote() << "pgorm preload failed, discarding all associations:" << QString::fromStdString(first_error->toString());
            return std::unexpected(*first_error);
        }
        return indexes;
    }

    std::expected<std::vector<Row>, Error> RelationshipPreloader::preload(const std::string &table, std::vector<Row> rows, const std::vector<std::string> &names) const {
        if (names.empty()) return rows;
        // 关联解析错误在发出任何查询之前返回
        auto plans = buildPlans(table, names);
        if (!plans) return std::unexpected(plans.error());
        if (rows.empty()) return rows;

        if (provider_.supportsConcurrentLeases() && plans->size() > 1 && options_.max_concurrency > 1) {
            auto indexes = loadConcurrent(*plans, rows);
            if (!indexes) return std::unexpected(indexes.error());
            for (size_t i = 0; i < plans->size(); ++i) {
                rows = attach(std::move(rows), (*plans)[i], (*indexes)[i]);
            }
            return rows;
        }

        auto lease = provider_.acquire();
        if (!lease) return std::unexpected(lease.error());
        Executor executor(lease->database());
        std::atomic<bool> cancelled{false};
        return loadSequential(executor, *plans, std::move(rows), cancelled);
    }

}  // namespace pgorm
