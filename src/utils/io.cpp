#include "routelib/utils/io.hpp"
#include "routelib/core/errors.hpp"

#include <stdexcept>
#include <type_traits>

namespace routelib::utils {

    namespace {

        // Line-oriented reader that reports the failing line number
        class LineReader {
            public:
                explicit LineReader(std::istream &in) : in_(in) {}

                std::string next(const char* what) {
                    std::string line;
                    if (!std::getline(in_, line))
                        throw core::ParseError("line " + std::to_string(lineNo_ + 1) + ": unexpected end of input, expected " + what);
                    lineNo_++;
                    return line;
                }

                // exactly `count` numbers of type T on the next line
                template <class T>
                std::vector<T> numbers(std::size_t count, const char* what) {
                    std::istringstream iss(next(what));
                    std::vector<T> values;
                    std::string token;

                    while (iss >> token) {
                        values.push_back(parse<T>(token, what));
                    }

                    if (values.size() != count)
                        throw core::ParseError("line " + std::to_string(lineNo_) + ": expected " + std::to_string(count)
                                               + " values for " + what + ", found " + std::to_string(values.size()));
                    return values;
                }

            private:
                template <class T>
                T parse(const std::string &token, const char* what) const {
                    std::size_t pos = 0;
                    T value{};
                    try {
                        if constexpr (std::is_integral_v<T>) value = static_cast<T>(std::stoll(token, &pos));
                        else value = static_cast<T>(std::stod(token, &pos));
                    } catch (const std::invalid_argument&) {
                        pos = 0;
                    } catch (const std::out_of_range&) {
                        pos = 0;
                    }

                    if (pos == 0 || pos != token.size())
                        throw core::ParseError("line " + std::to_string(lineNo_) + ": invalid number '" + token + "' in " + what);
                    return value;
                }

                std::istream &in_;
                int lineNo_ = 0;
        };

        int readSize(LineReader &reader)
        {
            long long n = reader.numbers<long long>(1, "the problem size")[0];
            if (n <= 0)
                throw core::ParseError("line 1: the problem size must be positive");
            return static_cast<int>(n);
        }

        std::vector<double> toCosts(const std::vector<long long> &values)
        {
            return std::vector<double>(values.begin(), values.end());
        }

    }

    problems::WasteCollectionProblem ReadWasteCollection(std::istream &in)
    {
        using Problem = problems::WasteCollectionProblem;

        LineReader reader(in);
        const int n = readSize(reader);

        std::array<Problem::Row, 2> entry;
        std::array<Problem::Row, 2> exit;
        std::array<Problem::Table, 4> pair;

        entry[0] = toCosts(reader.numbers<long long>(n, "the depot costs (orientation 0)"));
        entry[1] = toCosts(reader.numbers<long long>(n, "the depot costs (orientation 1)"));
        exit[0] = toCosts(reader.numbers<long long>(n, "the plant costs (orientation 0)"));
        exit[1] = toCosts(reader.numbers<long long>(n, "the plant costs (orientation 1)"));

        // blocks are stored in the file as 00, 01, 11, 10
        const std::array<int, 4> blockOrder = {
            Problem::pairIndex(0, 0), Problem::pairIndex(0, 1),
            Problem::pairIndex(1, 1), Problem::pairIndex(1, 0)
        };

        for (int block : blockOrder) {
            pair[block].reserve(n);
            for (int row = 0; row < n; row++)
                pair[block].push_back(toCosts(reader.numbers<long long>(n, "the container costs")));
        }

        return Problem(n, std::move(entry), std::move(exit), std::move(pair));
    }

    problems::TspProblem ReadTsp(std::istream &in)
    {
        LineReader reader(in);
        const int n = readSize(reader);

        std::vector<problems::Point> coords;
        coords.reserve(n);
        for (int k = 0; k < n; k++) {
            std::vector<double> xy = reader.numbers<double>(2, "a point");
            coords.push_back(problems::Point{xy[0], xy[1]});
        }

        return problems::TspProblem(std::move(coords));
    }

    void WriteSolution(std::ostream &out,
                       const core::ISolution<problems::WasteComponent, problems::WasteMove> &s)
    {
        for (const problems::WasteComponent &c : s.components())
            out << (c.unit + 1) << ' ' << c.orientation << '\n';
    }

    void WriteSolution(std::ostream &out,
                       const core::ISolution<problems::TspComponent, problems::TspMove> &s)
    {
        // the path begins with the start point, so a tour without edges still prints it
        const auto &tour = dynamic_cast<const problems::TspSolution&>(s);
        const std::vector<int> &path = tour.path();
        std::size_t open = tour.isComplete() ? path.size() - 1 : path.size();
        for (std::size_t k = 0; k < open; k++)
            out << path[k] << '\n';
    }

} // namespace routelib::utils
