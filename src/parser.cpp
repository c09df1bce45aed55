#include "parser.hpp"
#include "utils.hpp"
#include <fstream>
#include <sstream>
#include <iostream>
#include <cctype>
#include <algorithm>
#include <stdexcept>

NetlistParser::NetlistParser(Circuit& circuit, SimulationConfig& simConfig)
    : ckt(circuit), sim(simConfig) {}

std::string NetlistParser::stripInlineComment(const std::string& s)
{
    auto pos = s.find('$');
    if(pos == std::string::npos) return s;

    return s.substr(0,pos);
}

bool NetlistParser::isFullLineComment(const std::string& s) {
    std::string t = ltrim(s);
    if(t.empty()) return false;
    return (t[0] == '*' || t[0] == ';');
}

void NetlistParser::report(const Statement& st, const std::string& msg) {
    ++errors;
    std::cerr << sourceName << ":" << st.lineNo << ": " << msg
              << " in '" << st.raw << "'\n";
}

bool NetlistParser::parseFile(const std::string& filename) {
    std::ifstream fin(filename);
    if(!fin) {
        std::cerr << "无法打开网表文件 " << filename << "\n";
        return false;
    }
    return parseStream(fin, filename);
}

bool NetlistParser::parseStream(std::istream& in, const std::string& originName)
{
    sourceName = originName;
    errors = 0;
    lex(in);
    parseStatements();
    return errors == 0;
}

// ---- 词法分析：合并 '+' 续行 + 按空白切 token ----
void NetlistParser::lex(std::istream& in) {
    stmts.clear();

    std::string physical;
    std::string logical;
    int logicalStartLine = 0;
    int lineNo = 0;

    auto flushLogical = [&]() {
        if(logical.empty()) return;

        Statement st;
        st.lineNo = logicalStartLine;
        st.raw = logical;

        std::istringstream iss(logical);
        std::string tok;
        while(iss >> tok) {
            st.tokens.push_back(tok);
        }
        if(!st.tokens.empty()) {
            stmts.push_back(std::move(st));
        }
        logical.clear();
    };

    while(std::getline(in, physical)) {
        ++lineNo;

        if(isFullLineComment(physical)) continue;

        std::string s = rtrim(ltrim(stripInlineComment(physical)));
        if(s.empty()) continue;

        if(s[0] == '+') {
            std::string rest = ltrim(s.substr(1));
            if(logical.empty()) {
                // 没有前一行却遇到 '+'
                logicalStartLine = lineNo;
                logical = rest;
            } else {
                logical += " " + rest;
            }
        } else {
            flushLogical();
            logicalStartLine = lineNo;
            logical = s;
        }
    }

    flushLogical();
}

// 第一条语句若不像元件或控制卡，就当作标题
bool NetlistParser::isTitle(const Statement& st) const {
    const std::string& head = st.tokens[0];
    if(head[0] == '.') return false;

    char c0 = static_cast<char>(std::toupper(static_cast<unsigned char>(head[0])));
    bool looksLikeElement = (c0 == 'R' || c0 == 'V' || c0 == 'I' || c0 == 'D') &&
                            st.tokens.size() >= 4;
    return !looksLikeElement;
}

void NetlistParser::parseStatements() {
    std::size_t first = 0;
    if(!stmts.empty() && isTitle(stmts[0])) {
        sim.title = stmts[0].raw;
        first = 1;
    }

    // .model 可以出现在引用它的元件之后，先收集模型
    std::size_t last = first;
    for(; last < stmts.size(); ++last) {
        std::string head = toLower(stmts[last].tokens[0]);
        if(head == ".end") break;
        if(head == ".model") parseModelCard(stmts[last]);
    }

    for(std::size_t i = first; i < last; ++i) {
        const Statement& st = stmts[i];
        if(st.tokens[0][0] == '.') {
            if(toLower(st.tokens[0]) != ".model") parseDotCard(st);
            continue;
        }
        parseDeviceStmt(st);
    }
    if(last < stmts.size()) sim.sawEnd = true;

    sim.ensureDefaultOp();
}

void NetlistParser::parseDeviceStmt(const Statement& st) {
    char c0 = static_cast<char>(
        std::toupper(static_cast<unsigned char>(st.tokens[0][0]))
    );

    try {
        switch (c0) {
            case 'R': parseResistor(st);       break;
            case 'V': parseVoltageSource(st);  break;
            case 'I': parseCurrentSource(st);  break;
            case 'D': parseDiode(st);          break;
            default:
                report(st, "unsupported element");
                break;
        }
    } catch (const std::invalid_argument& e) {
        report(st, e.what());
    }
}

void NetlistParser::parseResistor(const Statement& st) {
    const auto& t = st.tokens;
    if (t.size() < 4) {
        report(st, "resistor needs two nodes and a value");
        return;
    }
    ckt.addResistor(t[0], t[1], t[2], parseSpiceNumber(t[3]));
}

// Xname np nm value / Xname np nm DC value
double NetlistParser::sourceValue(const Statement& st) const {
    const auto& t = st.tokens;
    if (t.size() >= 5 && toLower(t[3]) == "dc") {
        return parseSpiceNumber(t[4]);
    }
    return parseSpiceNumber(t[3]);
}

void NetlistParser::parseVoltageSource(const Statement& st) {
    if (st.tokens.size() < 4) {
        report(st, "voltage source needs two nodes and a value");
        return;
    }
    ckt.addVoltageSource(st.tokens[0], st.tokens[1], st.tokens[2], sourceValue(st));
}

void NetlistParser::parseCurrentSource(const Statement& st) {
    if (st.tokens.size() < 4) {
        report(st, "current source needs two nodes and a value");
        return;
    }
    ckt.addCurrentSource(st.tokens[0], st.tokens[1], st.tokens[2], sourceValue(st));
}

// Dname anode cathode model
void NetlistParser::parseDiode(const Statement& st) {
    const auto& t = st.tokens;
    if (t.size() < 4) {
        report(st, "diode needs anode, cathode and model");
        return;
    }
    ckt.addDiode(t[0], t[1], t[2], t[3]);
}

void NetlistParser::parseDotCard(const Statement& st) {
    std::string head = toLower(st.tokens[0]);

    if (head == ".op") {
        sim.doOp = true;
    } else if (head == ".save") {
        parseSaveCard(st);
    } else if (head == ".end") {
        sim.sawEnd = true;
    } else {
        report(st, "unsupported control card");
    }
}

// v(n) / v(n1,n2) / i(vname)
ProbeSpec NetlistParser::parseProbeToken(const std::string& token) const {
    ProbeSpec p;
    p.expr = token;

    auto l = token.find('(');
    auto r = token.rfind(')');
    if (l == std::string::npos || r == std::string::npos || r <= l + 1) {
        // 裸节点名
        p.node1 = toLower(token);
        return p;
    }

    std::string inside = token.substr(l + 1, r - l - 1);
    char c0 = static_cast<char>(std::toupper(static_cast<unsigned char>(token[0])));

    if (c0 == 'I') {
        p.kind = ProbeKind::BranchCurrent;
        p.eleName = rtrim(ltrim(inside));
        return p;
    }

    auto commaPos = inside.find(',');
    if (commaPos == std::string::npos) {
        p.node1 = toLower(rtrim(ltrim(inside)));
    } else {
        p.kind  = ProbeKind::DiffVoltage;
        p.node1 = toLower(rtrim(ltrim(inside.substr(0, commaPos))));
        p.node2 = toLower(rtrim(ltrim(inside.substr(commaPos + 1))));
    }
    return p;
}

void NetlistParser::parseSaveCard(const Statement& st) {
    for (std::size_t i = 1; i < st.tokens.size(); ++i) {
        sim.saves.push_back(parseProbeToken(st.tokens[i]));
    }
}

// .model name D(Is=1e-7 N=1.1 Rs=12 ...)，括号、逗号、等号两侧空格都可有可无
void NetlistParser::parseModelCard(const Statement& st) {
    const auto& t = st.tokens;
    if (t.size() < 3) {
        report(st, "invalid .MODEL");
        return;
    }

    std::string body;
    for (std::size_t i = 2; i < t.size(); ++i) {
        body += t[i] + " ";
    }
    std::replace(body.begin(), body.end(), '(', ' ');
    std::replace(body.begin(), body.end(), ')', ' ');
    std::replace(body.begin(), body.end(), ',', ' ');
    std::replace(body.begin(), body.end(), '=', ' ');

    std::istringstream iss(body);
    std::string type;
    iss >> type;
    if (toLower(type) != "d") {
        report(st, "unsupported model type '" + type + "'");
        return;
    }

    DiodeModel m;
    m.name = t[1];

    std::string key, val;
    while (iss >> key) {
        if (!(iss >> val)) {
            report(st, "missing value for model parameter " + key);
            return;
        }
        key = toLower(key);
        double v = 0.0;
        try {
            v = parseSpiceNumber(val);
        } catch (const std::invalid_argument& e) {
            report(st, e.what());
            return;
        }

        if      (key == "is") m.Is = v;
        else if (key == "n")  m.N  = v;
        else if (key == "rs") m.Rs = v;
        // 电容、击穿等参数与 DC 工作点无关
    }

    try {
        ckt.addDiodeModel(m);
    } catch (const std::invalid_argument& e) {
        report(st, e.what());
    }
}
