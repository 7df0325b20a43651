#ifndef pgorm_PRELOADER_H
#define pgorm_PRELOADER_H

#include <atomic>
#include <expected>
#include <map>
#include <string>
#include <vector>

#include "pgorm/connection_provider.h"
#include "pgorm/error.h"
#include "pgorm/executor.h"
#include "pgorm/row.h"
#include "pgorm/schema_registry.h"
#include "pgorm/sql_compiler.h"

namespace pgorm {

    struct PreloadOptions {
        size_t batch_size = DEFAULT_BATCH_SIZE;
        // 同时加载的顶层关联数上限, 只在连接来源支持并发租用时生效
        size_t max_concurrency = 4;
    };

    // 关联预加载: 每个关联路径按键批次各查询一次, 与行数无关.
    // 名字形如 "posts" 或 "posts.comments"; 嵌套部分在中间行上递归加载.
    // 任一查询失败时丢弃全部结果, 不会返回只加载了一部分的行
    class RelationshipPreloader {
      public:
        RelationshipPreloader(IConnectionProvider &provider, const SchemaRegistry &registry, PreloadOptions options = {});

        std::expected<std::vector<Row>, Error> preload(const std::string &table, std::vector<Row> rows, const std::vector<std::string> &names) const;

      private:
        struct PreloadPlan {
            std::string name;
            const RelationshipInfo *relationship = nullptr;
            const ModelMeta *related_meta = nullptr;
            std::vector<PreloadPlan> children;
        };
        // 关联表外键的 map 键 -> 关联行 (已挂好嵌套关联)
        using AssociationIndex = std::map<std::string, std::vector<Row>>;

        std::expected<std::vector<PreloadPlan>, Error> buildPlans(const std::string &table, const std::vector<std::string> &names) const;
        std::expected<AssociationIndex, Error> loadAssociation(Executor &executor, const PreloadPlan &plan, const std::vector<Row> &owners, const std::atomic<bool> &cancelled) const;
        std::expected<std::vector<Row>, Error> loadSequential(Executor &executor, const std::vector<PreloadPlan> &plans, std::vector<Row> rows, const std::atomic<bool> &cancelled) const;
        std::expected<std::vector<AssociationIndex>, Error> loadConcurrent(const std::vector<PreloadPlan> &plans, const std::vector<Row> &rows) const;

        static std::vector<Row> attach(std::vector<Row> owners, const PreloadPlan &plan, const AssociationIndex &index);

        IConnectionProvider &provider_;
        const SchemaRegistry &registry_;
        SqlCompiler compiler_;
        PreloadOptions options_;
    };

}  // namespace pgorm

#endif  // pgorm_PRELOADER_H
