#include "RutValidator.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

// ============================================================================
// DEMONSTRATION
// ============================================================================

class RutDetectorDemo
{
private:
    static void printRut(const Rut &rut)
    {
        std::cout << "  Number: " << rut.number() << "\n";
        std::cout << "  DV: " << rut.dv() << "\n";
        std::cout << "  RUT: " << rut << "\n";
    }

    static void printHeader(std::string_view title)
    {
        std::cout << "\n"
                  << std::string(100, '=') << "\n";
        std::cout << "=== " << title << " ===\n";
        std::cout << std::string(100, '=') << "\n";
    }

public:
    static void runParsingDemo()
    {
        printHeader("PARSING FROM TEXT");

        auto validator = RutValidatorFactory::createValidator();

        const std::vector<std::string> inputs = {
            "17.951.585-7",
            "17951585-7",
            "179515857",
            "17,951,585-7",
            "17951585K",
            "0.999.999-3",
        };

        for (const auto &input : inputs)
        {
            const auto result = validator->validate(input);
            std::cout << (result ? "VALID  " : "INVALID") << ": \"" << input << "\"\n";
            if (result)
                printRut(result.value());
            else
                std::cout << "  Error: " << result.error() << "\n";
        }

        const auto snapshot = validator->getStats().getSnapshot();
        std::cout << "\nValidations: " << snapshot.validations
                  << ", succeeded: " << snapshot.getSuccessCount()
                  << ", failed: " << snapshot.errors << std::endl;
    }

    static void runNumberDemo()
    {
        printHeader("PARSING FROM NUMBER");

        for (const uint32_t number : {24136773u, 999999u, RutRange::MAX})
        {
            const auto result = Rut::fromNumber(number);
            std::cout << number << ":\n";
            if (result)
                printRut(result.value());
            else
                std::cout << "  Error: " << result.error() << "\n";
        }

        std::cout << "\nAccepted range: [" << RutRange::toString(RutRange::MIN) << ", "
                  << RutRange::toString(RutRange::MAX) << ")" << std::endl;
    }

    static void runRandomizeDemo()
    {
        printHeader("RANDOMIZE");

        for (int i = 0; i < 3; ++i)
            printRut(Rut::randomize());
    }

    static void runFormatDemo()
    {
        printHeader("FORMAT");

        const auto rut = Rut::parse("179515857").value();
        std::cout << "Dots: " << rut.format(Format::DOTS) << "\n";
        std::cout << "Dash: " << rut.format(Format::DASH) << "\n";
        std::cout << "None: " << rut.format(Format::NONE) << std::endl;
    }

    static void runScanningDemo()
    {
        printHeader("TEXT SCANNING");

        auto scanner = RutValidatorFactory::createScanner();

        const std::vector<std::string> texts = {
            "Cliente 17.951.585-7 registrado.",
            "RUT: 5665328-7, apoderado 24136773-8",
            "Pagos de 12621806-0 y 12.621.806-0 (duplicado)",
            "Dígito erróneo 17951585-K, no se reporta",
            "Referencia ABC17951585-7 no es un RUT",
            "No hay identificadores aquí",
        };

        for (const auto &text : texts)
        {
            const bool found = scanner->contains(text);
            std::cout << (found ? "SENSITIVE" : "CLEAN    ") << ": \"" << text << "\"\n";
            if (found)
            {
                std::cout << "  => Found RUTs: ";
                for (const auto &rut : scanner->extract(text))
                    std::cout << rut.format(Format::DOTS) << " ";
                std::cout << "\n";
            }
        }
        std::cout << std::flush;
    }

    static void runPerformanceBenchmark()
    {
        printHeader("PERFORMANCE BENCHMARK");

        const std::vector<std::string> testCases = {
            "17.951.585-7",
            "17951585-7",
            "179515857",
            "5.665.328-7",
            "12621806-0",
            "24136773-8",
            "17951585-K",
            "17.951,585-7",
            "999.999-9",
            "Cliente 17.951.585-7 registrado.",
            "RUT: 5665328-7, apoderado 24136773-8",
            "No identifiers in this text at all",
            std::string(1000, 'x') + " 24136773-8 " + std::string(1000, 'y'),
        };

        const unsigned int numThreads = std::max(1u, std::thread::hardware_concurrency());
        const int iterationsPerThread = 100000;

        std::cout << "Threads: " << numThreads << std::endl;
        std::cout << "Iterations per thread: " << iterationsPerThread << std::endl;
        std::cout << "Test cases: " << testCases.size() << "\n";
        std::cout << "Total operations: " << (numThreads * iterationsPerThread * testCases.size()) << "\n";
        std::cout << "Starting benchmark...\n"
                  << std::flush;

        auto start = std::chrono::high_resolution_clock::now();

        std::atomic<long long> totalValidations{0};
        std::vector<std::thread> threads;

        for (unsigned int t = 0; t < numThreads; ++t)
        {
            threads.emplace_back(
                [&testCases, &totalValidations, iterationsPerThread]()
                {
                    RutValidator localValidator;
                    RutScanner localScanner;

                    long long localValidations = 0;

                    for (int i = 0; i < iterationsPerThread; ++i)
                    {
                        for (const auto &test : testCases)
                        {
                            if (localValidator.isValid(test) || localScanner.contains(test))
                            {
                                ++localValidations;
                            }
                        }
                    }

                    totalValidations.fetch_add(localValidations, std::memory_order_relaxed);
                });
        }

        for (auto &thread : threads)
        {
            thread.join();
        }

        auto end = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

        long long totalOps = static_cast<long long>(numThreads) * iterationsPerThread * testCases.size();
        long long elapsedMs = std::max<long long>(1, duration.count());

        std::cout << "\n"
                  << std::string(100, '-') << "\n";
        std::cout << "RESULTS:\n";
        std::cout << std::string(100, '-') << "\n";
        std::cout << "Time: " << duration.count() << " ms\n";
        std::cout << "Ops/sec: " << (totalOps * 1000 / elapsedMs) << "\n";
        std::cout << "Validations: " << totalValidations.load() << "\n";
        std::cout << std::string(100, '=') << "\n\n";
    }
};

// ============================================================================
// COMMAND LINE
// ============================================================================

// Validates each argument and prints it in every format; returns the failure count.
static int validateArguments(const std::vector<std::string_view> &args)
{
    const IRutValidator &validator = RutValidatorFactory::getValidator();
    int failures = 0;

    for (const auto arg : args)
    {
        const auto result = validator.validate(arg);
        if (!result)
        {
            std::cerr << arg << ": " << result.error() << std::endl;
            ++failures;
            continue;
        }

        const Rut &rut = result.value();
        std::cout << arg << ": " << rut.format(Format::DOTS) << " | "
                  << rut.format(Format::DASH) << " | "
                  << rut.format(Format::NONE) << std::endl;
    }

    return failures;
}

// ============================================================================
// MAIN
// ============================================================================

int main(int argc, char **argv)
{
    try
    {
        std::vector<std::string_view> args(argv + 1, argv + argc);

        if (args.size() == 1 && args.front() == "--benchmark")
        {
            RutDetectorDemo::runPerformanceBenchmark();
            return 0;
        }

        if (!args.empty())
        {
            return validateArguments(args) > 0 ? 1 : 0;
        }

        RutDetectorDemo::runParsingDemo();
        RutDetectorDemo::runNumberDemo();
        RutDetectorDemo::runRandomizeDemo();
        RutDetectorDemo::runFormatDemo();
        RutDetectorDemo::runScanningDemo();

        std::cout << "\n"
                  << std::string(100, '=') << std::endl;
        std::cout << "✓ RUT Detection Complete" << std::endl;
        std::cout << std::string(100, '=') << std::endl;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
