// surge

#include <surge/alloc.hh>
#include <surge/assembler.hh>
#include <surge/dataize.hh>
#include <surge/errors.hh>
#include <surge/graph.hh>
#include <surge/image.hh>
#include <surge/inspect.hh>
#include <surge/log.hh>
#include <surge/merge.hh>
#include <surge/native.hh>

#include <fmt/format.h>

#include <cstdio>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#if !defined(SURGE_VERSION)
#define SURGE_VERSION "0.0.0"
#endif

using namespace surge;

namespace surge::cli {
    enum ExitCode : int
    {
        ExitSuccess = 0,
        ExitUsage = 1,
        ExitAssembly = 2,
        ExitMerge = 3,
        ExitDataization = 4,
        ExitIO = 5,
    };

    class App
    {
    public:
        int run(int argc, char** argv);

    private:
        using GraphPtr = std::unique_ptr<sgGraph, decltype(&sgDestroyGraph)>;
        using Operands = std::vector<std::string_view>;

        int compile(Operands const& operands);
        int merge(Operands const& operands);
        int empty(Operands const& operands);
        int dataize(Operands const& operands);
        int inspect(Operands const& operands);
        int dot(Operands const& operands);

        GraphPtr load(std::string const& path, int& out_exit);
        int save(sgGraph const& graph, std::string const& path);
        int report(sgError const& error);

        static void writeLog(sgLogEvent const& event, void* userData);
        static void printUsage(std::FILE* stream);

        sgDefaultAllocator alloc_;
        sgLogger logger_;
    };

    int App::run(int argc, char** argv)
    {
        Operands const args(argv + 1, argv + argc);

        sgLogLevel level = sgLogLevel::Warn;

        std::size_t index = 0;
        for (; index != args.size() && args[index].starts_with("--"); ++index)
        {
            std::string_view const option = args[index];
            if (option == "--verbose")
                level = sgLogLevel::Info;
            else if (option == "--trace")
                level = sgLogLevel::Trace;
            else if (option == "--help")
            {
                printUsage(stdout);
                return ExitSuccess;
            }
            else if (option == "--version")
            {
                fmt::print("surge {}\n", SURGE_VERSION);
                return ExitSuccess;
            }
            else
            {
                fmt::print(stderr, "error: unknown option '{}'\n", option);
                printUsage(stderr);
                return ExitUsage;
            }
        }

        logger_.setSink(&App::writeLog);
        logger_.setLevel(level);
        logger_.enable();

        if (index == args.size())
        {
            printUsage(stderr);
            return ExitUsage;
        }

        std::string_view const command = args[index];
        Operands const operands(args.begin() + static_cast<std::ptrdiff_t>(index) + 1, args.end());

        if (command == "compile")
            return compile(operands);
        if (command == "merge")
            return merge(operands);
        if (command == "empty")
            return empty(operands);
        if (command == "dataize")
            return dataize(operands);
        if (command == "inspect")
            return inspect(operands);
        if (command == "dot")
            return dot(operands);

        fmt::print(stderr, "error: unknown command '{}'\n", command);
        printUsage(stderr);
        return ExitUsage;
    }

    int App::compile(Operands const& operands)
    {
        if (operands.size() != 2)
        {
            printUsage(stderr);
            return ExitUsage;
        }

        std::string const sourcePath(operands[0]);
        std::ifstream stream(sourcePath, std::ios::binary);
        if (!stream)
            return report(sgMakeError(sgErrorCode::ReadFailed, sgInvalidVertexId, sgName{sourcePath.c_str()}));

        std::string const source{std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>()};
        if (stream.bad())
            return report(sgMakeError(sgErrorCode::ReadFailed, sgInvalidVertexId, sgName{sourcePath.c_str()}));

        GraphPtr graph(sgCreateGraph(alloc_), &sgDestroyGraph);
        graph->setLogger(&logger_);

        std::unique_ptr<sgAssembler, decltype(&sgDestroyAssembler)> assembler(sgCreateAssembler(alloc_), &sgDestroyAssembler);
        assembler->setLogger(&logger_);

        if (!assembler->assemble(*graph, source.data(), source.data() + source.size()))
        {
            int exit = ExitAssembly;
            for (uint32_t index = 0; index != assembler->getErrorCount(); ++index)
                exit = report(assembler->getError(index));
            return exit;
        }

        SG_LOG_INFO(&logger_, "cli", "{}: {} instructions, {} vertices", sourcePath, assembler->instructionCount(), graph->vertexCount());
        return save(*graph, std::string(operands[1]));
    }

    int App::merge(Operands const& operands)
    {
        if (operands.size() < 2)
        {
            printUsage(stderr);
            return ExitUsage;
        }

        std::string const targetPath(operands[0]);

        int exit = ExitSuccess;
        GraphPtr target = load(targetPath, exit);
        if (target == nullptr)
            return exit;

        for (std::size_t index = 1; index != operands.size(); ++index)
        {
            GraphPtr input = load(std::string(operands[index]), exit);
            if (input == nullptr)
                return exit;

            sgError error;
            if (!sgMerge(*target, *input, error))
                return report(error);
        }

        return save(*target, targetPath);
    }

    int App::empty(Operands const& operands)
    {
        if (operands.size() != 1)
        {
            printUsage(stderr);
            return ExitUsage;
        }

        GraphPtr graph(sgCreateGraph(alloc_), &sgDestroyGraph);
        return save(*graph, std::string(operands[0]));
    }

    int App::dataize(Operands const& operands)
    {
        if (operands.size() != 2)
        {
            printUsage(stderr);
            return ExitUsage;
        }

        int exit = ExitSuccess;
        GraphPtr graph = load(std::string(operands[0]), exit);
        if (graph == nullptr)
            return exit;

        std::unique_ptr<sgNativeRegistry, decltype(&sgDestroyNativeRegistry)> registry(sgCreateNativeRegistry(alloc_),
            &sgDestroyNativeRegistry);
        if (!sgRegisterBuiltins(*registry))
        {
            fmt::print(stderr, "error: failed to register built-in natives\n");
            return ExitDataization;
        }

        std::unique_ptr<sgDataizer, decltype(&sgDestroyDataizer)> dataizer(sgCreateDataizer(alloc_, *registry, *graph),
            &sgDestroyDataizer);
        dataizer->setLogger(&logger_);

        std::string const locator = fmt::format("Φ.{}", operands[1]);

        sgBytes bytes;
        if (!dataizer->dataizeLocator(locator.data(), locator.data() + locator.size(), bytes))
        {
            for (uint32_t index = 0; index != dataizer->getErrorCount(); ++index)
                exit = report(dataizer->getError(index));
            return exit;
        }

        fmt::print("{}\n", sgFormatBytes(bytes));
        return ExitSuccess;
    }

    int App::inspect(Operands const& operands)
    {
        if (operands.empty() || operands.size() > 2)
        {
            printUsage(stderr);
            return ExitUsage;
        }

        int exit = ExitSuccess;
        GraphPtr graph = load(std::string(operands[0]), exit);
        if (graph == nullptr)
            return exit;

        sgVertexId vertex = sgRootVertexId;
        if (operands.size() == 2)
        {
            std::unique_ptr<sgNativeRegistry, decltype(&sgDestroyNativeRegistry)> registry(sgCreateNativeRegistry(alloc_),
                &sgDestroyNativeRegistry);
            std::unique_ptr<sgDataizer, decltype(&sgDestroyDataizer)> dataizer(sgCreateDataizer(alloc_, *registry, *graph),
                &sgDestroyDataizer);
            dataizer->setLogger(&logger_);

            std::string_view const locator = operands[1];
            if (!dataizer->locate(locator.data(), locator.data() + locator.size(), vertex))
                return report(dataizer->getError(0));
        }

        fmt::print("{}", sgInspect(*graph, vertex));
        return ExitSuccess;
    }

    int App::dot(Operands const& operands)
    {
        if (operands.size() != 2)
        {
            printUsage(stderr);
            return ExitUsage;
        }

        int exit = ExitSuccess;
        GraphPtr graph = load(std::string(operands[0]), exit);
        if (graph == nullptr)
            return exit;

        std::string const outputPath(operands[1]);
        std::string const text = sgRenderDot(*graph);

        std::ofstream stream(outputPath, std::ios::binary);
        stream.write(text.data(), static_cast<std::streamsize>(text.size()));
        stream.close();
        if (!stream)
            return report(sgMakeError(sgErrorCode::WriteFailed, sgInvalidVertexId, sgName{outputPath.c_str()}));

        return ExitSuccess;
    }

    auto App::load(std::string const& path, int& out_exit) -> GraphPtr
    {
        sgError error;
        GraphPtr graph(sgLoadGraph(alloc_, path.c_str(), error), &sgDestroyGraph);
        if (graph == nullptr)
        {
            out_exit = report(error);
            return graph;
        }

        graph->setLogger(&logger_);
        SG_LOG_INFO(&logger_, "cli", "loaded {}: {} vertices, {} edges", path, graph->vertexCount(), graph->edgeCount());
        return graph;
    }

    int App::save(sgGraph const& graph, std::string const& path)
    {
        sgError error;
        if (!sgSaveGraph(alloc_, graph, path.c_str(), error))
            return report(error);

        SG_LOG_INFO(&logger_, "cli", "saved {}: {} vertices, {} edges", path, graph.vertexCount(), graph.edgeCount());
        return ExitSuccess;
    }

    int App::report(sgError const& error)
    {
        sgErrorCategory const category = sgErrorCategoryOf(error.code);

        std::string message = fmt::format("error: {}", sgErrorCodeName(error.code));
        if (error.vertex.valid())
            message += fmt::format(" at ν{}", error.vertex.value());
        if (error.name[0] != '\0')
            message += fmt::format(" '{}'", error.name);
        if (error.line != 0)
            message += fmt::format(" (line {})", error.line);
        fmt::print(stderr, "{}\n", message);

        switch (category)
        {
        case sgErrorCategory::Assembly: return ExitAssembly;
        case sgErrorCategory::Merge: return ExitMerge;
        case sgErrorCategory::Dataization: return ExitDataization;
        case sgErrorCategory::IO: return ExitIO;
        case sgErrorCategory::None: break;
        }
        return ExitUsage;
    }

    void App::writeLog(sgLogEvent const& event, void*)
    {
        fmt::print(stderr, "[{}] {}: {}\n", sgLogLevelName(event.level), event.tag,
            fmt::string_view(event.message, event.messageLength));
    }

    void App::printUsage(std::FILE* stream)
    {
        fmt::print(stream,
            "usage: surge [--verbose|--trace] <command> ...\n"
            "\n"
            "commands:\n"
            "  compile <source.sodg> <out.sgi>   assemble construction text into an image\n"
            "  merge <target.sgi> <input.sgi>... merge images into target\n"
            "  empty <out.sgi>                   write an image with only the root\n"
            "  dataize <image.sgi> <name>        print the bytes of Φ.<name>\n"
            "  inspect <image.sgi> [locator]     print the attribute tree\n"
            "  dot <image.sgi> <out.dot>         write a graphviz rendering\n"
            "\n"
            "options:\n"
            "  --verbose   log progress to stderr\n"
            "  --trace     log every graph operation to stderr\n"
            "  --help      show this text\n"
            "  --version   show the version\n");
    }
} // namespace surge::cli

int main(int argc, char** argv)
{
    surge::cli::App app;
    return app.run(argc, argv);
}
