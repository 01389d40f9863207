#include <QCoreApplication>
#include <QFile>
#include <QString>
#include <QStringList>
#include <QDebug>
#include <spc.hpp>

#include <string>
#include <vector>

namespace {

spc::AddressInput demoCreditor()
{
    spc::AddressInput a;
    a.name = "Robert Schneider AG";
    a.street = "Rue du Lac";
    a.houseNumber = std::string("1268");
    a.postalCode = "2501";
    a.city = "Biel";
    a.countryCode = "CH";
    return a;
}

spc::AddressInput demoDebtor()
{
    spc::AddressInput a;
    a.name = "Pia-Maria Rutschmann-Schnyder";
    a.street = "Grosse Marktgasse";
    a.houseNumber = std::string("28");
    a.postalCode = "9400";
    a.city = "Rorschach";
    a.countryCode = "ch";
    return a;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    auto L = [](const char* label, int w = 24){
        return QString(label).leftJustified(w, QLatin1Char(' '));
    };
    auto S = [](const std::string& s){ return QString::fromUtf8(s.c_str()); };

    spc::DisplayOptions display;

    // (1) QR-IBAN + QR reference generated from an invoice number
    // (2) IBAN + creditor reference
    // (3) IBAN without reference, no amount, no debtor
    std::vector<spc::PaymentInput> inputs(3);

    inputs[0].creditor.account = "CH44 3199 9123 0008 8901 2";
    inputs[0].creditor.address = demoCreditor();
    inputs[0].debtor = demoDebtor();
    inputs[0].amount = 1949.75;
    inputs[0].reference = spc::generate_qr_reference("R-2025-0042");
    inputs[0].message = "Rechnung R-2025-0042\nDanke!";

    inputs[1].creditor.account = "CH93 0076 2011 6238 5295 7";
    inputs[1].creditor.address = demoCreditor();
    inputs[1].amount = 199.95;
    inputs[1].currency = std::string("EUR");
    inputs[1].reference = spc::generate_creditor_reference("539007547034").value_or("");

    inputs[2].creditor.account = "CH9300762011623852957";
    inputs[2].creditor.address = demoCreditor();

    QString outPath = argc > 1 ? QString::fromLocal8Bit(argv[1]) : QString();

    for (std::size_t i = 0; i < inputs.size(); ++i)
    {
        std::optional<spc::PaymentDocument> doc;
        std::string err;
        if (!spc::PaymentDocument::try_create(inputs[i], doc, &err))
        {
            qCritical("Validation error: %s", err.c_str());
            return 1;
        }

        qDebug().noquote() << L("Account:")        << S(spc::format_account(doc->account(), display));
        qDebug().noquote() << L("Reference type:") << spc::reference_kind_token(doc->reference_kind());
        if (!doc->reference().empty())
            qDebug().noquote() << L("Reference:")  << S(spc::format_reference(doc->reference(), display));
        if (auto amt = doc->amount())
            qDebug().noquote() << L("Amount:")     << S(amt->currency) << S(spc::format_amount(*amt, display));

        const std::string payload = doc->payload();
        const QStringList lines = S(payload).split(QStringLiteral("\r\n"));
        int n = 1;
        for (const QString& line : lines)
            qDebug().noquote() << QString::number(n++).rightJustified(2, QLatin1Char(' ')) << "|" << line;

        if (!outPath.isEmpty())
        {
            QFile f(outPath + "." + QString::number(i + 1) + ".txt");
            if (!f.open(QIODevice::WriteOnly))
            {
                qCritical("Cannot write %s", qPrintable(f.fileName()));
                return 1;
            }
            f.write(payload.data(), static_cast<qint64>(payload.size()));
            qDebug().noquote() << "[INFO] Payload written to" << f.fileName();
        }
        qDebug() << "";
    }

    // Pre-check: report every problem of a broken input at once
    spc::PaymentInput broken;
    broken.creditor.account = "CH44 3199 9123 0008 8901 3";
    broken.creditor.address.name = "\n\t";
    broken.creditor.address.city = "Biel";
    broken.creditor.address.postalCode = "2501";
    broken.creditor.address.countryCode = "Schweiz";
    broken.amount = 0.0;
    broken.currency = std::string("USD");

    const auto problems = spc::check_payment(broken);
    qInfo("Pre-check found %d problem(s):", static_cast<int>(problems.size()));
    for (const auto& v : problems)
        qInfo().noquote() << " " << L(spc::error_kind_name(v.kind), 32) << S(v.field) << "-" << S(v.message);

    qInfo("Done.");
    return 0;
}
