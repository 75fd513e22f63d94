#include "resq/pipeline/allocation_pipeline.hpp"
#include "resq/resources/in_memory_resource_catalog.hpp"
#include "resq/rules/rule_loader.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace
{

void print_usage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " <config-dir> <resources.json> <request.json>\n"
              << "  <config-dir> holds trigger_rules.json, hard_rules.json,\n"
              << "  task_templates.json and pipeline.json\n";
}

} // namespace

int main(int argc, char** argv)
{
    if (argc != 4)
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }
    const std::string config_dir = argv[1];
    const std::string resources_path = argv[2];
    const std::string request_path = argv[3];

    try
    {
        std::cout << "\n\n====== resq ======\n" << std::flush;

        resq::PipelineConfig config = resq::load_pipeline_config_file(config_dir + "/pipeline.json");

        resq::PipelineDependencies deps;
        deps.rule_engine = std::make_shared<const resq::RuleEngine>(
            resq::load_trigger_rules_file(config_dir + "/trigger_rules.json"));
        deps.templates = std::make_shared<const resq::TaskTemplateLibrary>(
            resq::load_task_templates_file(config_dir + "/task_templates.json"));
        deps.hard_rules = resq::load_hard_rules_file(config_dir + "/hard_rules.json");
        deps.catalog = std::make_shared<resq::InMemoryResourceCatalog>(
            resq::load_resources_file(resources_path));
        deps.locks = resq::make_resource_lock_manager(config.locking);
        deps.audit = std::make_shared<resq::StreamAuditSink>(std::cout);
        deps.notifications = std::make_shared<resq::LoggingNotificationSink>();

        resq::AllocationRequest request = resq::load_allocation_request_file(request_path);
        resq::AllocationPipeline pipeline(config, deps);
        resq::PipelineResult result = pipeline.run(request);

        std::cout << "\n" << result.summary() << "\n";
        for (const auto& scored : result.ranked)
        {
            std::cout << "  #" << scored.rank << " " << scored.solution.solution_id << " score "
                      << resq::format_decimal(scored.total_score) << " resources "
                      << scored.solution.selected_resources.size() << "\n";
        }
        for (const auto& rejection : result.rejections)
        {
            std::cout << "  rejected " << rejection.solution_id << ":";
            for (const auto& reason : rejection.reasons)
            {
                std::cout << " " << reason << ";";
            }
            std::cout << "\n";
        }

        std::cout << "\n\n====== normal exit ======\n" << std::flush;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        std::cout << "\n\n====== abnormal exit ======\n" << std::flush;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
