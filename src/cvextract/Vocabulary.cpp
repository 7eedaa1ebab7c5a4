#include "cvextract/Vocabulary.hpp"

#include "cvextract/TextUtil.hpp"

namespace cvextract {
namespace vocab {

const std::vector<std::pair<SectionKind, std::vector<std::string>>>& heading_aliases() {
    static const std::vector<std::pair<SectionKind, std::vector<std::string>>> aliases = {
        {SectionKind::About, {
            "about", "summary", "profile", "acerca de", "sobre", "à propos", "profil",
            "zusammenfassung", "riepilogo", "resumo", "resumen", "samenvatting",
            "обо мне", "о себе", "общее", "общие сведения", "сводка", "профиль",
        }},
        {SectionKind::Experience, {
            "experience", "work experience", "professional experience", "employment history",
            "experiencia", "experiencia laboral", "expérience", "expérience professionnelle",
            "ervaring", "werkervaring", "berufserfahrung", "erfahrung", "experiência",
            "esperienza", "esperienza lavorativa", "опыт", "опыт работы",
        }},
        {SectionKind::Education, {
            "education", "educación", "formation", "formación", "ausbildung", "educacao",
            "educação", "formação", "istruzione", "opleiding", "образование",
        }},
        {SectionKind::Skills, {
            "skills", "top skills", "kompetenzen", "kenntnisse", "top-kenntnisse", "compétences",
            "principales compétences", "habilidades", "aptitudes", "principales aptitudes",
            "competenze", "competenze principali", "competências", "principais competências",
            "vaardigheden", "навыки", "основные навыки", "ключевые навыки",
        }},
        {SectionKind::Certifications, {
            "licenses & certifications", "licenses and certifications", "certifications",
            "certificazioni", "certificados", "certificações", "certificats", "zertifikate",
            "zertifizierungen", "certificeringen", "сертификаты", "сертификации",
            "лицензии и сертификаты",
        }},
        {SectionKind::Projects, {
            "projects", "projets", "proyectos", "projetos", "progetti", "projekte", "projecten",
            "проекты",
        }},
        {SectionKind::Volunteer, {
            "volunteer", "volunteering", "volunteer experience", "volontariat", "voluntariado",
            "volontariato", "ehrenamt", "vrijwilligerswerk", "волонтерство",
            "волонтерская деятельность",
        }},
        {SectionKind::Languages, {
            "languages", "sprachkenntnisse", "sprachen", "langues", "idiomas", "lingue", "talen",
            "языки",
        }},
        {SectionKind::Interests, {
            "interests", "hobbies", "centres d'interet", "centres d'intérêt", "interessi",
            "interesses", "intereses", "aficiones", "interessen", "интересы", "увлечения", "хобби",
        }},
    };
    return aliases;
}

const std::unordered_map<std::string, SectionKind>& heading_lookup() {
    static const std::unordered_map<std::string, SectionKind> lookup = [] {
        std::unordered_map<std::string, SectionKind> m;
        for (const auto& row : heading_aliases()) {
            for (const auto& alias : row.second) {
                m.emplace(textutil::normalize_heading(alias), row.first);
            }
        }
        return m;
    }();
    return lookup;
}

const std::unordered_map<std::string, int>& month_lookup() {
    struct Row { const char* word; int month; };
    static const Row rows[] = {
        // english
        {"jan", 1}, {"january", 1}, {"feb", 2}, {"february", 2}, {"mar", 3}, {"march", 3},
        {"apr", 4}, {"april", 4}, {"may", 5}, {"jun", 6}, {"june", 6}, {"jul", 7}, {"july", 7},
        {"aug", 8}, {"august", 8}, {"sep", 9}, {"sept", 9}, {"september", 9}, {"oct", 10},
        {"october", 10}, {"nov", 11}, {"november", 11}, {"dec", 12}, {"december", 12},
        // german / dutch
        {"januar", 1}, {"februar", 2}, {"märz", 3}, {"maart", 3}, {"mai", 5}, {"mei", 5},
        {"juni", 6}, {"juli", 7}, {"okt", 10}, {"oktober", 10}, {"dez", 12}, {"dezember", 12},
        // french
        {"janv", 1}, {"janvier", 1}, {"fév", 2}, {"févr", 2}, {"février", 2}, {"mars", 3},
        {"avr", 4}, {"avril", 4}, {"juin", 6}, {"juil", 7}, {"juillet", 7}, {"août", 8},
        {"oct", 10}, {"octobre", 10}, {"déc", 12}, {"décembre", 12},
        // spanish / portuguese / italian
        {"ene", 1}, {"enero", 1}, {"gen", 1}, {"gennaio", 1}, {"janeiro", 1}, {"fev", 2},
        {"fevereiro", 2}, {"febrero", 2}, {"febbraio", 2}, {"marzo", 3}, {"março", 3},
        {"abr", 4}, {"abril", 4}, {"aprile", 4}, {"mayo", 5}, {"maio", 5}, {"mag", 5},
        {"maggio", 5}, {"junio", 6}, {"junho", 6}, {"giu", 6}, {"giugno", 6}, {"julio", 7},
        {"julho", 7}, {"lug", 7}, {"luglio", 7}, {"ago", 8}, {"agosto", 8}, {"set", 9},
        {"setembro", 9}, {"settembre", 9}, {"septiembre", 9}, {"out", 10}, {"outubro", 10},
        {"ott", 10}, {"ottobre", 10}, {"octubre", 10}, {"noviembre", 11}, {"novembro", 11},
        {"novembre", 11}, {"dic", 12}, {"diciembre", 12}, {"dicembre", 12}, {"dezembro", 12},
        // russian
        {"янв", 1}, {"январь", 1}, {"января", 1}, {"фев", 2}, {"февраль", 2}, {"февраля", 2},
        {"мар", 3}, {"март", 3}, {"марта", 3}, {"апр", 4}, {"апрель", 4}, {"апреля", 4},
        {"май", 5}, {"мая", 5}, {"июн", 6}, {"июнь", 6}, {"июня", 6}, {"июл", 7}, {"июль", 7},
        {"июля", 7}, {"авг", 8}, {"август", 8}, {"августа", 8}, {"сен", 9}, {"сентябрь", 9},
        {"сентября", 9}, {"окт", 10}, {"октябрь", 10}, {"октября", 10}, {"ноя", 11},
        {"ноябрь", 11}, {"ноября", 11}, {"дек", 12}, {"декабрь", 12}, {"декабря", 12},
    };
    static const std::unordered_map<std::string, int> lookup = [] {
        std::unordered_map<std::string, int> m;
        for (const auto& r : rows) m.emplace(textutil::fold(r.word), r.month);
        return m;
    }();
    return lookup;
}

const std::vector<std::string>& present_markers() {
    static const std::vector<std::string> markers = [] {
        const std::vector<std::string> raw = {
            "present", "current", "today", "now", "настоящее время", "настоящий момент",
            "по настоящее время", "н.в.", "н. в.", "сейчас", "heute", "aujourd'hui", "actuel",
            "presente", "actualidad", "actual", "atual", "oggi", "heden",
        };
        std::vector<std::string> folded;
        for (const auto& r : raw) folded.push_back(textutil::fold(r));
        return folded;
    }();
    return markers;
}

const std::vector<std::string>& range_words() {
    static const std::vector<std::string> words = {"to", "till", "until", "bis", "до", "по", "à", "até", "al", "tot"};
    return words;
}

const std::vector<std::string>& location_keywords() {
    static const std::vector<std::string> words = [] {
        const std::vector<std::string> raw = {
            "area", "region", "province", "state", "metropolitan", "county",
            "région", "regione", "región", "provincia", "província", "estado", "landkreis",
            "область", "край", "регион", "агломерация", "район", "республика",
        };
        std::vector<std::string> folded;
        for (const auto& r : raw) folded.push_back(textutil::fold(r));
        return folded;
    }();
    return words;
}

const std::vector<std::string>& role_keywords() {
    static const std::vector<std::string> words = {
        "developer", "engineer", "manager", "director", "lead", "architect", "consultant",
        "analyst", "designer", "owner", "founder", "cto", "ceo", "vp", "head", "principal",
        "intern", "specialist", "scientist", "researcher",
        "разработчик", "инженер", "руководитель", "менеджер", "директор", "аналитик",
    };
    return words;
}

const std::vector<std::string>& degree_keywords() {
    static const std::vector<std::string> words = {
        "bachelor", "master", "phd", "doctor", "bsc", "msc", "mba", "ba", "ma",
        "licenciatura", "diplom", "бакалавр", "магистр", "специалист",
    };
    return words;
}

const std::vector<std::string>& degree_line_keywords() {
    static const std::vector<std::string> words = {
        "degree", "bachelor", "master", "phd", "бакалавр", "магистр",
    };
    return words;
}

const std::vector<std::string>& employment_type_terms() {
    static const std::vector<std::string> words = {
        "full-time", "part-time", "contract", "internship", "self-employed", "freelance",
        "полная занятость", "частичная занятость",
    };
    return words;
}

const std::vector<std::string>& company_suffixes() {
    static const std::vector<std::string> words = {" Oy", " Inc", " LLC", " Ltd", " GmbH", " S.A."};
    return words;
}

const std::vector<std::string>& contact_noise_lines() {
    static const std::vector<std::string> words = {
        "contact", "способы связаться", "контакты", "контактная информация",
    };
    return words;
}

const std::vector<std::string>& achievement_labels() {
    static const std::vector<std::string> words = {"achievements:", "achievements", "main responsibilities:"};
    return words;
}

const std::vector<std::string>& bullet_markers() {
    static const std::vector<std::string> markers = {"-", "•", "–"};
    return markers;
}

const std::vector<std::string>& list_delimiters() {
    static const std::vector<std::string> delims = {"•", "·", ",", ";", "|"};
    return delims;
}

std::optional<int> month_number(const std::string& word) {
    std::string key = textutil::fold(textutil::trim(word));
    while (!key.empty() && (key.back() == '.' || key.back() == ',')) key.pop_back();
    if (key.empty()) return std::nullopt;

    const auto& months = month_lookup();
    auto it = months.find(key);
    if (it != months.end()) return it->second;

    it = months.find(textutil::prefix(key, 3));
    if (it != months.end()) return it->second;
    return std::nullopt;
}

bool is_present_marker(const std::string& text) {
    const std::string key = textutil::fold(textutil::trim(text));
    for (const auto& m : present_markers()) {
        if (key == m) return true;
    }
    return false;
}

}  // namespace vocab
}  // namespace cvextract
