#pragma once

#include <istream>
#include <string>
#include <vector>
#include "circuit.hpp"
#include "sim.hpp"

// SPICE 子集：标题行、R / V / I / D 元件、.model D(...)、.op、.save、.end
class NetlistParser {
public:
    NetlistParser(Circuit& circuit, SimulationConfig& simConfig);

    bool parseFile(const std::string& filename);

    // 有任何一行出错时返回 false（出错的行已报到 std::cerr 并跳过）
    bool parseStream(std::istream& in, const std::string& originName = "<stream>");

    int errorCount() const { return errors; }

private:
    struct Statement {
        int lineNo = 0;
        std::string raw;
        std::vector<std::string> tokens;
    };

    Circuit& ckt;
    SimulationConfig& sim;
    std::string sourceName;
    std::vector<Statement> stmts;
    int errors = 0;

    void lex(std::istream& in);

    void parseStatements();

     // ---- 工具函数 ----
    static std::string stripInlineComment(const std::string& s);
    static bool isFullLineComment(const std::string& s);

    void report(const Statement& st, const std::string& msg);

    ProbeSpec parseProbeToken(const std::string& token) const;

    void parseDeviceStmt(const Statement& st);
    void parseDotCard (const Statement& st);
    bool isTitle(const Statement& st) const;

    // 器件
    void parseResistor     (const Statement& st);
    void parseVoltageSource(const Statement& st);
    void parseCurrentSource(const Statement& st);
    void parseDiode        (const Statement& st);

    // 控制卡
    void parseSaveCard (const Statement& st);
    void parseModelCard(const Statement& st);

    double sourceValue(const Statement& st) const;
};

inline bool parseNetlist(
    const std::string& filename, Circuit& ckt,
    SimulationConfig& sim
) {
    NetlistParser parser(ckt, sim);
    bool ok = parser.parseFile(filename);
    sim.ensureDefaultOp();
    return ok;
}
